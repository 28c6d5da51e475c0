// SPECTER - Logger utility
// Console logging with verbosity control and trace file support

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace specter {

enum class Verbosity { Quiet, Normal, Verbose };

class Logger {
public:
    Verbosity console_level = Verbosity::Normal;

private:
    std::chrono::steady_clock::time_point start_;
    std::ofstream trace_file_;
    std::mutex mutex_;
    std::string module_name_;
    std::string version_;

    double elapsed() const {
        return std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
    }

    std::string timestamp() const {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&time));
        return buf;
    }

    void write_trace(const std::string& line) {
        if (trace_file_.is_open()) {
            trace_file_ << line << "\n";
            trace_file_.flush();
        }
    }

public:
    Logger() : start_(std::chrono::steady_clock::now()) {}

    explicit Logger(const std::string& module_name, const std::string& version = "")
        : start_(std::chrono::steady_clock::now()),
          module_name_(module_name),
          version_(version) {}

    ~Logger() {
        if (trace_file_.is_open()) {
            trace_file_ << "\n[" << timestamp() << "] Run completed in "
                       << std::fixed << std::setprecision(1) << elapsed() << "s\n";
            trace_file_.close();
        }
    }

    bool open_trace(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        trace_file_.open(path);
        if (!trace_file_.is_open()) return false;

        trace_file_ << "SPECTER";
        if (!module_name_.empty()) trace_file_ << " " << module_name_;
        if (!version_.empty()) trace_file_ << " v" << version_;
        trace_file_ << "\n";
        trace_file_ << "Started: " << timestamp() << "\n";
        trace_file_ << std::string(60, '=') << "\n\n";
        return true;
    }

    void info(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_level >= Verbosity::Normal) {
            std::cerr << "[" << module_name_ << "] " << msg << "\n";
        }
        write_trace("[" + std::to_string(int(elapsed())) + "s] " + msg);
    }

    void detail(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (console_level >= Verbosity::Verbose) {
            std::cerr << "  " << msg << "\n";
        }
        write_trace("  " + msg);
    }

    void warn(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "Warning: " << msg << "\n";
        write_trace("[WARN] " + msg);
    }

    void error(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "Error: " << msg << "\n";
        write_trace("[ERROR] " + msg);
    }

    void section(const std::string& title) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("\n" + std::string(60, '='));
        write_trace(" " + title);
        write_trace(std::string(60, '='));
    }

    void metric(const std::string& name, double value, int precision = 4) {
        std::ostringstream ss;
        ss << "  " << name << ": " << std::fixed << std::setprecision(precision) << value;
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace(ss.str());
    }

    void metric(const std::string& name, int64_t value) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("  " + name + ": " + std::to_string(value));
    }

    void metric(const std::string& name, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("  " + name + ": " + value);
    }

    void decision(const std::string& type, const std::string& outcome,
                  const std::string& rationale = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("[DECISION:" + type + "] " + outcome);
        if (!rationale.empty()) {
            write_trace("  rationale: " + rationale);
        }
    }

    // Log table header for structured output
    void table_header(const std::string& title, const std::vector<std::string>& columns) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_trace("\n[TABLE:" + title + "]");
        std::ostringstream ss;
        for (size_t i = 0; i < columns.size(); i++) {
            if (i > 0) ss << "\t";
            ss << columns[i];
        }
        write_trace(ss.str());
    }

    void table_row(const std::vector<std::string>& values) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream ss;
        for (size_t i = 0; i < values.size(); i++) {
            if (i > 0) ss << "\t";
            ss << values[i];
        }
        write_trace(ss.str());
    }
};

}  // namespace specter

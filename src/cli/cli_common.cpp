// SPECTER - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include "../core/errors.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace specter {

namespace {

std::string padded(std::string s, size_t width) {
    while (s.length() < width) s += " ";
    return s;
}

std::string option_label(const CLIOption& opt) {
    std::string label = "  " + opt.name;
    if (!opt.arg_name.empty()) label += " " + opt.arg_name;
    return label;
}

}  // namespace

void CLICommand::print_help() const {
    std::cerr << "Usage: specter " << name << " [options]\n\n";
    std::cerr << description << "\n";
    for (const auto& line : description_extra) {
        std::cerr << line << "\n";
    }
    std::cerr << "\n";

    // Column width from the longest option/output label
    size_t col = 21;
    for (const auto& opt : options) col = std::max(col, option_label(opt).length() + 1);
    for (const auto& out : outputs) col = std::max(col, out.filename.length() + 3);

    bool any_required = false;
    for (const auto& opt : options) any_required |= opt.required;

    if (any_required) {
        std::cerr << "Required:\n";
        for (const auto& opt : options) {
            if (opt.required) std::cerr << padded(option_label(opt), col) << opt.description << "\n";
        }
        std::cerr << "\n";
    }

    std::cerr << "Options:\n";
    for (const auto& opt : options) {
        if (opt.required) continue;
        std::string desc = opt.description;
        if (!opt.default_value.empty()) desc += " (default: " + opt.default_value + ")";
        std::cerr << padded(option_label(opt), col) << desc << "\n";
    }
    std::cerr << "\n";

    if (!outputs.empty()) {
        std::cerr << "Output:\n";
        for (const auto& out : outputs) {
            std::string desc = out.description;
            if (!out.condition.empty()) desc += " " + out.condition;
            std::cerr << padded("  " + out.filename, col) << desc << "\n";
        }
        std::cerr << "\n";
    }

    if (!note.empty()) {
        std::cerr << "Note:\n  " << note << "\n\n";
    }

    if (!examples.empty()) {
        std::cerr << "Example:\n";
        for (const auto& ex : examples) {
            std::cerr << "  " << ex << "\n";
        }
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    return has_flag(argc, argv, "-h") || has_flag(argc, argv, "--help");
}

bool CLICommand::has_flag(int argc, char** argv, const std::string& flag) const {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) return true;
    }
    return false;
}

const CLIOption* CLICommand::find(const std::string& opt_name) const {
    for (const auto& opt : options) {
        if (opt.name == opt_name) return &opt;
    }
    return nullptr;
}

std::string CLICommand::get_option(int argc, char** argv, const std::string& opt_name) const {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == opt_name) return argv[i + 1];
    }
    const CLIOption* opt = find(opt_name);
    return opt ? opt->default_value : "";
}

double CLICommand::get_double(int argc, char** argv, const std::string& opt_name) const {
    const std::string v = get_option(argc, argv, opt_name);
    char* end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (v.empty() || *end != '\0') {
        throw SpecterError("Invalid value for " + opt_name + ": '" + v + "'");
    }
    return d;
}

int CLICommand::get_int(int argc, char** argv, const std::string& opt_name) const {
    const int64_t n = get_int64(argc, argv, opt_name);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw SpecterError("Value out of range for " + opt_name + ": " + std::to_string(n));
    }
    return static_cast<int>(n);
}

int64_t CLICommand::get_int64(int argc, char** argv, const std::string& opt_name) const {
    const std::string v = get_option(argc, argv, opt_name);
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0') {
        throw SpecterError("Invalid integer for " + opt_name + ": '" + v + "'");
    }
    if (errno == ERANGE) {
        throw SpecterError("Value out of range for " + opt_name + ": '" + v + "'");
    }
    return static_cast<int64_t>(n);
}

std::vector<std::string> CLICommand::get_missing_required(int argc, char** argv) const {
    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (!opt.required) continue;
        bool found = false;
        for (int i = 1; i < argc - 1 && !found; ++i) {
            found = (argv[i] == opt.name);
        }
        if (!found) missing.push_back(opt.name);
    }
    return missing;
}

bool CLICommand::validate_required(int argc, char** argv) const {
    auto missing = get_missing_required(argc, argv);
    if (missing.empty()) return true;

    std::cerr << "Error: Missing required arguments.\n";
    std::cerr << "Required:";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << " " << missing[i];
    }
    std::cerr << "\n\n";
    print_help();
    return false;
}

}  // namespace specter

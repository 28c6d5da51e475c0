// SPECTER - cli_common.h
// Common CLI infrastructure for consistent command-line interface

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace specter {

struct CLIOption {
    std::string name;           // e.g., "--metadata"
    std::string arg_name;       // e.g., "FILE", "N", "" for flags
    std::string description;
    std::string default_value;  // "" if required or no default
    bool required;

    CLIOption(const std::string& n, const std::string& arg, const std::string& desc,
              const std::string& def = "", bool req = false)
        : name(n), arg_name(arg), description(desc), default_value(def), required(req) {}
};

struct CLIOutput {
    std::string filename;
    std::string description;
    std::string condition;      // e.g., "(with --refseq-assemblies)" or ""

    CLIOutput(const std::string& f, const std::string& d, const std::string& c = "")
        : filename(f), description(d), condition(c) {}
};

struct CLICommand {
    std::string name;
    std::string description;
    std::vector<std::string> description_extra;  // Additional description lines
    std::vector<CLIOption> options;
    std::vector<CLIOutput> outputs;
    std::string note;
    std::vector<std::string> examples;

    // Print formatted help message to stderr
    void print_help() const;

    bool has_help_flag(int argc, char** argv) const;

    // Returns false (after printing the missing options and help) if a
    // required option is absent
    bool validate_required(int argc, char** argv) const;

    // Option value; falls back to the default declared in options
    std::string get_option(int argc, char** argv, const std::string& name) const;

    // Numeric option value; throws SpecterError when not a number or out of range
    double get_double(int argc, char** argv, const std::string& name) const;
    int get_int(int argc, char** argv, const std::string& name) const;
    int64_t get_int64(int argc, char** argv, const std::string& name) const;

    bool has_flag(int argc, char** argv, const std::string& flag) const;

    std::vector<std::string> get_missing_required(int argc, char** argv) const;

private:
    const CLIOption* find(const std::string& name) const;
};

// Command definitions
CLICommand make_qc_command();
CLICommand make_rank_command();
CLICommand make_radius_command();
CLICommand make_clusters_command();

// Command handlers; argv[0] is the command name
int cmd_qc(int argc, char** argv);
int cmd_rank(int argc, char** argv);
int cmd_radius(int argc, char** argv);
int cmd_clusters(int argc, char** argv);

}  // namespace specter

// SPECTER - SPECies Type sElection and Reconciliation
// Main entry point with git-style subcommand dispatch

#include <specter/config.hpp>
#include "cli/cli_common.h"
#include <iostream>
#include <string>

constexpr const char* CODENAME = "SPECies Type sElection and Reconciliation";

static void print_version() {
    std::cout << "specter " << specter::VERSION << "\n";
    std::cout << CODENAME << "\n";
}

static void print_usage(const char* prog) {
    std::cerr << "SPECTER - " << CODENAME << "\n";
    std::cerr << "Version: " << specter::VERSION << "\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  qc               Quality check candidate genomes\n";
    std::cerr << "  rank             Rank genomes by quality score and type material\n";
    std::cerr << "  radius           ANI radius of species representatives\n";
    std::cerr << "  clusters         Recompute species cluster ANI/AF statistics\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help     Show this help message\n";
    std::cerr << "  -v, --version  Show version information\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  specter qc --metadata gtdb_metadata.tsv.gz --marker-report domain_report.tsv --output qc/\n";
    std::cerr << "  specter radius --clusters clusters.tsv --ani reps_ani.tsv --output type_radius.tsv\n";
    std::cerr << "\n";
    std::cerr << "For command-specific help, use: specter <command> --help\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    }

    if (cmd == "qc") {
        return specter::cmd_qc(argc - 1, argv + 1);
    } else if (cmd == "rank") {
        return specter::cmd_rank(argc - 1, argv + 1);
    } else if (cmd == "radius") {
        return specter::cmd_radius(argc - 1, argv + 1);
    } else if (cmd == "clusters") {
        return specter::cmd_clusters(argc - 1, argv + 1);
    } else {
        std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
}

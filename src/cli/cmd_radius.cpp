// SPECTER - cmd_radius.cpp
// CLI handler for the 'radius' subcommand

#include "cli_common.h"
#include <specter/config.hpp>
#include "../core/genome_id.h"
#include "../core/type_radius.h"
#include "../io/ani_table.h"
#include "../io/cluster_report.h"
#include "../io/metadata_table.h"
#include "../util/logger.h"

namespace specter {

CLICommand make_radius_command() {
    CLICommand cmd;
    cmd.name = "radius";
    cmd.description = "Compute the ANI radius of each species representative.";
    cmd.description_extra = {
        "",
        "The radius is the symmetric ANI/AF to the closest representative of another species.",
    };

    cmd.options = {
        {"--clusters", "FILE", "Species cluster file (representatives and species names)", "", true},
        {"--ani", "FILE", "Directional ANI/AF table (Query, Reference, ANI, AF)", "", true},
        {"--output", "FILE", "Output type radius file", "", true},
        {"--metadata", "FILE", "GTDB metadata used to check genome ids"},
        {"--threads", "N", "Number of threads", "1"},
        {"--trace", "FILE", "Write a detailed trace log"},
        {"--verbose", "", "Verbose console output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<output>", "Species, representative, ANI, AF, closest species and representative"},
    };

    cmd.examples = {
        "specter radius --clusters gtdb_clusters.tsv --ani reps_ani.tsv --output type_radius.tsv",
    };

    return cmd;
}

namespace {

int run_radius(const RadiusConfig& config, Logger& log) {
    ClusterTable table = read_clusters(config.cluster_file);
    log.info("Read " + std::to_string(table.clusters.size()) + " species representatives");

    GenomeIdIndex index;
    if (!config.metadata_file.empty()) {
        for (const auto& [gid, rec] : read_gtdb_metadata(config.metadata_file)) index.add(gid);
        log.detail("Checking ids against " + std::to_string(index.size()) + " metadata genomes");
    }
    add_cluster_ids(table, index, config.cluster_file);

    std::vector<std::string> reps;
    for (const auto& [rid, members] : table.clusters) reps.push_back(rid);

    AniAfMatrix ani_af = read_ani_af_table(config.ani_file, &index);
    log.info("Read " + std::to_string(ani_af.size()) + " directional ANI/AF values");

    TypeRadiusMap radius = compute_type_radius(reps, ani_af, config.threads);

    int64_t isolated = 0;
    for (const auto& [gid, r] : radius) {
        if (!r.neighbour_gid) {
            isolated++;
            log.detail("No related representative for " + gid);
        }
    }
    log.metric("representatives", static_cast<int64_t>(radius.size()));
    log.metric("without neighbour", isolated);

    write_type_radius(radius, table.species, config.output_file);
    log.info("Type radius written to: " + config.output_file);
    return 0;
}

}  // namespace

int cmd_radius(int argc, char** argv) {
    CLICommand cmd = make_radius_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    Logger log("radius", VERSION);
    try {
        RadiusConfig config;
        config.cluster_file = cmd.get_option(argc, argv, "--clusters");
        config.ani_file = cmd.get_option(argc, argv, "--ani");
        config.output_file = cmd.get_option(argc, argv, "--output");
        config.metadata_file = cmd.get_option(argc, argv, "--metadata");
        config.trace_file = cmd.get_option(argc, argv, "--trace");
        config.threads = cmd.get_int(argc, argv, "--threads");
        config.verbose = cmd.has_flag(argc, argv, "--verbose");

        if (config.verbose) log.console_level = Verbosity::Verbose;
        if (!config.trace_file.empty() && !log.open_trace(config.trace_file)) {
            log.warn("Cannot open trace file: " + config.trace_file);
        }
        return run_radius(config, log);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
}

}  // namespace specter

// SPECTER - cmd_clusters.cpp
// CLI handler for the 'clusters' subcommand
//
// Recomputes per-cluster ANI/AF statistics from the symmetric ANI/AF between
// each representative and its clustered genomes.

#include "cli_common.h"
#include <specter/config.hpp>
#include "../core/ani_reconciler.h"
#include "../core/genome_id.h"
#include "../io/ani_table.h"
#include "../io/cluster_report.h"
#include "../util/logger.h"

namespace specter {

CLICommand make_clusters_command() {
    CLICommand cmd;
    cmd.name = "clusters";
    cmd.description = "Recompute species cluster ANI/AF statistics.";

    cmd.options = {
        {"--clusters", "FILE", "Species cluster file", "", true},
        {"--ani", "FILE", "Directional ANI/AF table (Query, Reference, ANI, AF)", "", true},
        {"--output", "FILE", "Output cluster file", "", true},
        {"--trace", "FILE", "Write a detailed trace log"},
        {"--verbose", "", "Verbose console output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<output>", "Cluster file with mean/min ANI and AF per species"},
    };

    cmd.note = "Members without ANI/AF in both directions are reported with ANI and AF of 0.";

    cmd.examples = {
        "specter clusters --clusters gtdb_clusters.tsv --ani cluster_ani.tsv --output gtdb_clusters_stats.tsv",
    };

    return cmd;
}

namespace {

int run_clusters(const ClustersConfig& config, Logger& log) {
    ClusterTable table = read_clusters(config.cluster_file);

    // ANI table ids must use the same origin prefix form as the cluster file
    GenomeIdIndex index;
    add_cluster_ids(table, index, config.cluster_file);
    AniAfMatrix ani_af = read_ani_af_table(config.ani_file, &index);
    log.info("Read " + std::to_string(table.clusters.size()) + " clusters and " +
             std::to_string(ani_af.size()) + " directional ANI/AF values");

    ClusterMap clusters;
    int64_t unrelated = 0;
    for (const auto& [rid, members] : table.clusters) {
        auto& out = clusters[rid];
        for (const auto& gid : members) {
            AniAf s = symmetric_ani(ani_af, rid, gid);
            if (s.ani == 0.0) {
                unrelated++;
                log.detail("No ANI/AF between " + rid + " and " + gid);
            }
            out.push_back({gid, s.ani, s.af});
        }
    }
    if (unrelated > 0) {
        log.warn(std::to_string(unrelated) + " clustered genomes lack ANI/AF to their representative");
    }
    log.metric("members without ANI/AF", unrelated);

    write_clusters(clusters, table.species, config.output_file);
    log.info("Cluster statistics written to: " + config.output_file);
    return 0;
}

}  // namespace

int cmd_clusters(int argc, char** argv) {
    CLICommand cmd = make_clusters_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    Logger log("clusters", VERSION);
    try {
        ClustersConfig config;
        config.cluster_file = cmd.get_option(argc, argv, "--clusters");
        config.ani_file = cmd.get_option(argc, argv, "--ani");
        config.output_file = cmd.get_option(argc, argv, "--output");
        config.trace_file = cmd.get_option(argc, argv, "--trace");
        config.verbose = cmd.has_flag(argc, argv, "--verbose");

        if (config.verbose) log.console_level = Verbosity::Verbose;
        if (!config.trace_file.empty() && !log.open_trace(config.trace_file)) {
            log.warn("Cannot open trace file: " + config.trace_file);
        }
        return run_clusters(config, log);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
}

}  // namespace specter

// SPECTER - cmd_rank.cpp
// CLI handler for the 'rank' subcommand
//
// Scores genomes and marks the preferred representative of each GTDB species:
// GTDB type strain first, then NCBI type strain, then highest quality score.

#include "cli_common.h"
#include <specter/config.hpp>
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../core/quality_score.h"
#include "../core/type_strain.h"
#include "../io/cluster_report.h"
#include "../io/genome_lists.h"
#include "../io/metadata_table.h"
#include "../util/logger.h"

#include <algorithm>
#include <fstream>
#include <set>
#include <tuple>

namespace specter {

CLICommand make_rank_command() {
    CLICommand cmd;
    cmd.name = "rank";
    cmd.description = "Rank genomes by quality score and type material status.";

    cmd.options = {
        {"--metadata", "FILE", "GTDB metadata table (CSV/TSV, may be gzipped)", "", true},
        {"--output", "FILE", "Output ranking table", "", true},
        {"--qc-file", "FILE", "Only rank genomes passing QC (qc_passed.tsv)"},
        {"--trace", "FILE", "Write a detailed trace log"},
        {"--verbose", "", "Verbose console output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<output>", "Genome, species, quality score, type status and preferred representative"},
    };

    cmd.examples = {
        "specter rank --metadata gtdb_metadata.tsv.gz --qc-file qc/qc_passed.tsv --output ranked.tsv",
    };

    return cmd;
}

namespace {

struct RankedGenome {
    std::string gid;
    std::string species;
    double score = 0.0;
    bool gtdb_type = false;
    bool ncbi_type = false;
    bool preferred = false;
};

// Representative preference key, larger is better
std::tuple<bool, bool, double> preference(const RankedGenome& g) {
    return {g.gtdb_type, g.ncbi_type, g.score};
}

int run_rank(const RankConfig& config, Logger& log) {
    MetadataMap metadata = read_gtdb_metadata(config.metadata_file, config.keep_db_prefix);
    log.info("Read metadata for " + std::to_string(metadata.size()) + " genomes");

    std::vector<std::string> gids;
    if (!config.qc_file.empty()) {
        GenomeIdIndex index;
        for (const auto& [gid, rec] : metadata) index.add(gid);
        for (const auto& gid : read_qc_file(config.qc_file)) {
            gids.push_back(index.resolve(gid, config.qc_file));
        }
        log.info("Ranking " + std::to_string(gids.size()) + " genomes passing QC");
    } else {
        for (const auto& [gid, rec] : metadata) gids.push_back(gid);
    }

    const std::map<std::string, double> scores = quality_score(gids, metadata);
    const std::set<std::string> ncbi_types = ncbi_type_strain_of_species(metadata);
    const std::set<std::string> gtdb_types = gtdb_type_strain_of_species(metadata);
    log.detail("NCBI type strains of species: " + std::to_string(ncbi_types.size()));
    log.detail("GTDB type strains of species: " + std::to_string(gtdb_types.size()));

    std::vector<RankedGenome> ranked;
    ranked.reserve(gids.size());
    for (const auto& gid : gids) {
        RankedGenome g;
        g.gid = gid;
        g.species = metadata.at(gid).gtdb_species();
        g.score = scores.at(gid);
        g.gtdb_type = gtdb_types.count(gid) > 0;
        g.ncbi_type = ncbi_types.count(gid) > 0;
        ranked.push_back(std::move(g));
    }

    // Best genome per named species
    std::map<std::string, size_t> best;
    for (size_t i = 0; i < ranked.size(); i++) {
        const auto& g = ranked[i];
        if (g.species == RANK_PREFIXES[NUM_RANKS - 1]) continue;

        auto it = best.find(g.species);
        if (it == best.end() || preference(g) > preference(ranked[it->second])) {
            best[g.species] = i;
        }
    }
    for (const auto& [sp, idx] : best) {
        ranked[idx].preferred = true;
        log.decision("representative", sp + " -> " + ranked[idx].gid,
                     ranked[idx].gtdb_type ? "GTDB type strain"
                     : ranked[idx].ncbi_type ? "NCBI type strain" : "highest quality score");
    }
    log.info("Preferred representatives for " + std::to_string(best.size()) + " species");

    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });

    std::ofstream out(config.output_file);
    if (!out) throw SpecterError("Failed to open output file: " + config.output_file);
    out << "Genome\tGTDB species\tQuality score\tGTDB type species\tNCBI type species\tPreferred representative\n";
    for (const auto& g : ranked) {
        out << g.gid << '\t' << g.species << '\t' << format_fixed(g.score) << '\t'
            << (g.gtdb_type ? "true" : "false") << '\t'
            << (g.ncbi_type ? "true" : "false") << '\t'
            << (g.preferred ? "true" : "false") << '\n';
    }
    if (!out) throw SpecterError("Failed writing ranking table: " + config.output_file);

    log.info("Ranking written to: " + config.output_file);
    return 0;
}

}  // namespace

int cmd_rank(int argc, char** argv) {
    CLICommand cmd = make_rank_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    Logger log("rank", VERSION);
    try {
        RankConfig config;
        config.metadata_file = cmd.get_option(argc, argv, "--metadata");
        config.output_file = cmd.get_option(argc, argv, "--output");
        config.qc_file = cmd.get_option(argc, argv, "--qc-file");
        config.trace_file = cmd.get_option(argc, argv, "--trace");
        config.verbose = cmd.has_flag(argc, argv, "--verbose");

        if (config.verbose) log.console_level = Verbosity::Verbose;
        if (!config.trace_file.empty() && !log.open_trace(config.trace_file)) {
            log.warn("Cannot open trace file: " + config.trace_file);
        }
        return run_rank(config, log);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
}

}  // namespace specter

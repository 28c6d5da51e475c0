// SPECTER - cmd_qc.cpp
// CLI handler for the 'qc' subcommand

#include "cli_common.h"
#include <specter/config.hpp>
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../core/qc_filter.h"
#include "../io/genome_lists.h"
#include "../io/marker_report.h"
#include "../io/metadata_table.h"
#include "../io/qc_report.h"
#include "../util/logger.h"

#include <iostream>

namespace specter {

CLICommand make_qc_command() {
    CLICommand cmd;
    cmd.name = "qc";
    cmd.description = "Quality check candidate genomes against GTDB admission criteria.";
    cmd.description_extra = {
        "",
        "Genomes with strain heterogeneity >= --sh-exception may have up to 20% contamination;",
        "their quality is computed with contamination discounted by the heterogeneity.",
    };

    cmd.options = {
        {"--metadata", "FILE", "GTDB metadata table (CSV/TSV, may be gzipped)", "", true},
        {"--marker-report", "FILE", "GTDB domain report with marker percentages", "", true},
        {"--output", "DIR", "Output directory", "", true},
        {"--genome-ids", "FILE", "Restrict QC to genomes listed in FILE"},
        {"--refseq-assemblies", "FILE", "NCBI RefSeq assembly summary"},
        {"--genbank-assemblies", "FILE", "NCBI GenBank assembly summary"},
        {"--min-comp", "F", "Minimum completeness (%)", "50"},
        {"--max-cont", "F", "Maximum contamination (%)", "10"},
        {"--min-quality", "F", "Minimum quality (completeness - 5*contamination)", "50"},
        {"--sh-exception", "F", "Strain heterogeneity (%) that relaxes contamination", "80"},
        {"--min-perc-markers", "F", "Minimum marker genes identified (%)", "40"},
        {"--max-contigs", "N", "Maximum number of contigs", "1000"},
        {"--min-n50", "N", "Minimum contig N50", "5000"},
        {"--max-ambiguous", "N", "Maximum ambiguous bases", "100000"},
        {"--threads", "N", "Number of threads", "1"},
        {"--trace", "FILE", "Write a detailed trace log"},
        {"--verbose", "", "Verbose console output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"qc_passed.tsv", "Genomes passing QC with their quality statistics"},
        {"qc_failed.tsv", "Genomes failing QC with the failed tests"},
    };

    cmd.examples = {
        "specter qc --metadata gtdb_metadata.tsv.gz --marker-report gtdb_domain_report.tsv --output qc/",
    };

    return cmd;
}

namespace {

QcConfig parse_qc_config(const CLICommand& cmd, int argc, char** argv) {
    QcConfig config;
    config.metadata_file = cmd.get_option(argc, argv, "--metadata");
    config.marker_report = cmd.get_option(argc, argv, "--marker-report");
    config.output_dir = cmd.get_option(argc, argv, "--output");
    config.genome_id_file = cmd.get_option(argc, argv, "--genome-ids");
    config.refseq_assembly_file = cmd.get_option(argc, argv, "--refseq-assemblies");
    config.genbank_assembly_file = cmd.get_option(argc, argv, "--genbank-assemblies");
    config.trace_file = cmd.get_option(argc, argv, "--trace");

    config.min_comp = cmd.get_double(argc, argv, "--min-comp");
    config.max_cont = cmd.get_double(argc, argv, "--max-cont");
    config.min_quality = cmd.get_double(argc, argv, "--min-quality");
    config.sh_exception = cmd.get_double(argc, argv, "--sh-exception");
    config.min_perc_markers = cmd.get_double(argc, argv, "--min-perc-markers");
    config.max_contigs = cmd.get_int64(argc, argv, "--max-contigs");
    config.min_n50 = cmd.get_int64(argc, argv, "--min-n50");
    config.max_ambiguous = cmd.get_int64(argc, argv, "--max-ambiguous");
    config.threads = cmd.get_int(argc, argv, "--threads");
    config.verbose = cmd.has_flag(argc, argv, "--verbose");
    return config;
}

QcThresholds thresholds_from(const QcConfig& config) {
    QcThresholds t;
    t.min_comp = config.min_comp;
    t.max_cont = config.max_cont;
    t.min_quality = config.min_quality;
    t.sh_exception = config.sh_exception;
    t.min_perc_markers = config.min_perc_markers;
    t.max_contigs = config.max_contigs;
    t.min_n50 = config.min_n50;
    t.max_ambiguous = config.max_ambiguous;
    return t;
}

int run_qc_genomes(const QcConfig& config, Logger& log) {
    log.section("Inputs");
    log.metric("metadata", config.metadata_file);
    log.metric("marker report", config.marker_report);
    log.metric("threads", static_cast<int64_t>(config.threads));

    MetadataMap metadata = read_gtdb_metadata(config.metadata_file);
    log.info("Read metadata for " + std::to_string(metadata.size()) + " genomes");

    GenomeIdIndex index;
    for (const auto& [gid, rec] : metadata) index.add(gid);

    std::map<std::string, double> marker_perc;
    for (const auto& [gid, perc] : parse_marker_percentages(config.marker_report)) {
        marker_perc[index.resolve(gid, config.marker_report)] = perc;
    }
    log.detail("Marker percentages for " + std::to_string(marker_perc.size()) + " genomes");

    std::vector<std::string> gids;
    if (!config.genome_id_file.empty()) {
        GenomeIdLists lists = read_genome_id_file(config.genome_id_file);
        for (const auto* s : {&lists.ncbi, &lists.user}) {
            for (const auto& gid : *s) gids.push_back(index.resolve(gid, config.genome_id_file));
        }
        log.info("Restricting QC to " + std::to_string(lists.ncbi.size()) + " NCBI and " +
                 std::to_string(lists.user.size()) + " user genomes");
    } else {
        for (const auto& [gid, rec] : metadata) gids.push_back(gid);
    }

    std::map<std::string, std::string> excluded;
    if (!config.refseq_assembly_file.empty() || !config.genbank_assembly_file.empty()) {
        excluded = exclude_from_refseq(config.refseq_assembly_file, config.genbank_assembly_file);
        log.detail("Read excluded_from_refseq notes for " + std::to_string(excluded.size()) + " assemblies");
    }

    const QcThresholds t = thresholds_from(config);
    log.section("Quality control");
    log.metric("min_comp", t.min_comp, 2);
    log.metric("max_cont", t.max_cont, 2);
    log.metric("min_quality", t.min_quality, 2);
    log.metric("sh_exception", t.sh_exception, 2);
    log.metric("min_perc_markers", t.min_perc_markers, 2);
    log.metric("max_contigs", t.max_contigs);
    log.metric("min_N50", t.min_n50);
    log.metric("max_ambiguous", t.max_ambiguous);

    QcBatchResult batch = run_qc(gids, metadata, marker_perc, t, config.threads);

    const size_t passed = batch.num_passed();
    log.info("Genomes passing QC: " + std::to_string(passed) + " of " + std::to_string(gids.size()));
    log.info("Genomes failing QC: " + std::to_string(gids.size() - passed));

    log.table_header("qc_failures", {"Test", "Genomes failing"});
    for (int c = 0; c < NUM_QC_CATEGORIES; c++) {
        const auto cat = static_cast<QcCategory>(c);
        const int64_t n = batch.failure_counts.count(cat);
        log.table_row({qc_category_name(cat), std::to_string(n)});
        log.detail(std::string("Failed ") + qc_category_name(cat) + ": " + std::to_string(n));
    }

    write_qc_reports(batch, metadata, marker_perc, excluded, config.output_dir);
    log.info("Quality checking information written to: " + config.output_dir);
    return 0;
}

}  // namespace

int cmd_qc(int argc, char** argv) {
    CLICommand cmd = make_qc_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    Logger log("qc", VERSION);
    try {
        QcConfig config = parse_qc_config(cmd, argc, argv);
        if (config.verbose) log.console_level = Verbosity::Verbose;
        if (!config.trace_file.empty() && !log.open_trace(config.trace_file)) {
            log.warn("Cannot open trace file: " + config.trace_file);
        }
        return run_qc_genomes(config, log);
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
}

}  // namespace specter

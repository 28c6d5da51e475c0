// SPECTER - qc_report.cpp

#include "qc_report.h"
#include "cluster_report.h"
#include "../core/errors.h"

#include <filesystem>
#include <fstream>

namespace specter {

namespace {

void write_genome_columns(std::ofstream& out, const std::string& gid,
                          const MetadataRecord& rec, double marker_perc) {
    out << gid << '\t'
        << format_fixed(rec.checkm_completeness) << '\t'
        << format_fixed(rec.checkm_contamination) << '\t'
        << format_fixed(rec.checkm_completeness - 5.0 * rec.checkm_contamination) << '\t'
        << format_fixed(rec.checkm_strain_heterogeneity_100) << '\t'
        << format_fixed(marker_perc) << '\t'
        << rec.contig_count << '\t'
        << rec.n50_contigs << '\t'
        << rec.ambiguous_bases;
}

}  // namespace

void write_qc_reports(const QcBatchResult& batch,
                      const MetadataMap& metadata,
                      const std::map<std::string, double>& marker_perc,
                      const std::map<std::string, std::string>& excluded_from_refseq,
                      const std::string& output_dir) {
    std::filesystem::create_directories(output_dir);
    const std::string passed_path = output_dir + "/qc_passed.tsv";
    const std::string failed_path = output_dir + "/qc_failed.tsv";

    std::ofstream passed(passed_path);
    if (!passed) throw SpecterError("Failed to open output file: " + passed_path);
    std::ofstream failed(failed_path);
    if (!failed) throw SpecterError("Failed to open output file: " + failed_path);

    const char* columns = "Accession\tCompleteness (%)\tContamination (%)\tQuality"
                          "\tStrain heterogeneity at 100%\tMarker percentage"
                          "\tNo. contigs\tN50 contigs\tAmbiguous bases";
    passed << columns << '\n';
    failed << columns << "\tFailed tests";
    if (!excluded_from_refseq.empty()) failed << "\tExcluded from RefSeq";
    failed << '\n';

    for (size_t i = 0; i < batch.gids.size(); i++) {
        const std::string& gid = batch.gids[i];
        const QcResult& r = batch.results[i];
        const MetadataRecord& rec = metadata.at(gid);
        const double perc = marker_perc.at(gid);

        if (r.passed) {
            write_genome_columns(passed, gid, rec, perc);
            passed << '\n';
        } else {
            write_genome_columns(failed, gid, rec, perc);
            failed << '\t' << r.failed_names();
            if (!excluded_from_refseq.empty()) {
                auto it = excluded_from_refseq.find(gid);
                failed << '\t' << (it == excluded_from_refseq.end() ? "" : it->second);
            }
            failed << '\n';
        }
    }

    if (!passed || !failed) throw SpecterError("Failed writing QC reports to " + output_dir);
}

}  // namespace specter

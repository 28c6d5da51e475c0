// SPECTER - qc_report.h
// Per-genome QC reports for genomes passing and failing quality control

#pragma once

#include "../core/metadata_record.h"
#include "../core/qc_filter.h"

#include <map>
#include <string>

namespace specter {

// Writes qc_passed.tsv and qc_failed.tsv into output_dir.
// excluded_from_refseq notes are added to qc_failed.tsv when provided.
void write_qc_reports(const QcBatchResult& batch,
                      const MetadataMap& metadata,
                      const std::map<std::string, double>& marker_perc,
                      const std::map<std::string, std::string>& excluded_from_refseq,
                      const std::string& output_dir);

}  // namespace specter

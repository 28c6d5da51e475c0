// SPECTER - qc_filter.h
// Pass/fail genome admissibility with per-criterion failure accounting
//
// Every criterion is checked independently so a genome can fail several at
// once. Genomes with high strain heterogeneity take a lenient contamination
// path: contamination from closely related strains is discounted in
// proportion to the heterogeneity instead of being penalized at full weight.

#pragma once

#include "metadata_record.h"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace specter {

enum class QcCategory {
    Completeness,     // comp
    Contamination,    // cont
    Quality,          // qual
    MarkerPercentage, // marker_perc
    ContigCount,      // contig_count
    N50,              // N50
    Ambiguous,        // ambig
};

constexpr int NUM_QC_CATEGORIES = 7;

// Report name of a category ("comp", "cont", ...)
const char* qc_category_name(QcCategory c);

// Contamination ceiling on the strain heterogeneity path
constexpr double SH_MAX_CONTAMINATION = 20.0;

struct QcThresholds {
    double min_comp = 50.0;
    double max_cont = 10.0;
    double min_quality = 50.0;
    double sh_exception = 80.0;
    double min_perc_markers = 40.0;
    int64_t max_contigs = 1000;
    int64_t min_n50 = 5000;
    int64_t max_ambiguous = 100000;
};

// Number of genomes failing each category over a batch.
// Partial counts from independent workers merge with +=.
class QcFailureCounts {
public:
    QcFailureCounts() { counts_.fill(0); }

    void increment(QcCategory c) { counts_[static_cast<int>(c)]++; }
    int64_t count(QcCategory c) const { return counts_[static_cast<int>(c)]; }
    int64_t count(const std::string& name) const;
    int64_t total() const;

    QcFailureCounts& operator+=(const QcFailureCounts& other) {
        for (int i = 0; i < NUM_QC_CATEGORIES; i++) counts_[i] += other.counts_[i];
        return *this;
    }

    std::map<std::string, int64_t> as_map() const;

private:
    std::array<int64_t, NUM_QC_CATEGORIES> counts_;
};

struct QcResult {
    bool passed = true;
    std::vector<QcCategory> failed;  // in category order

    bool failed_category(QcCategory c) const;
    std::string failed_names() const;  // comma-joined, "" when passed
};

QcResult evaluate_qc(const MetadataRecord& rec, double marker_perc, const QcThresholds& t);

// evaluate_qc plus an increment of every failed category in counts
bool pass_qc(const MetadataRecord& rec, double marker_perc, const QcThresholds& t,
             QcFailureCounts& counts);

struct QcBatchResult {
    std::vector<std::string> gids;
    std::vector<QcResult> results;   // parallel to gids
    QcFailureCounts failure_counts;

    size_t num_passed() const;
};

// QC for a batch of genomes, in parallel when built with OpenMP.
// All records and marker percentages are checked for presence first;
// a missing one raises MissingFieldError before any genome is evaluated.
QcBatchResult run_qc(const std::vector<std::string>& gids,
                     const MetadataMap& metadata,
                     const std::map<std::string, double>& marker_perc,
                     const QcThresholds& t,
                     int threads = 1);

}  // namespace specter

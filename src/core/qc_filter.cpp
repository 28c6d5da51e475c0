// SPECTER - qc_filter.cpp

#include "qc_filter.h"
#include "errors.h"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace specter {

const char* qc_category_name(QcCategory c) {
    switch (c) {
        case QcCategory::Completeness:     return "comp";
        case QcCategory::Contamination:    return "cont";
        case QcCategory::Quality:          return "qual";
        case QcCategory::MarkerPercentage: return "marker_perc";
        case QcCategory::ContigCount:      return "contig_count";
        case QcCategory::N50:              return "N50";
        case QcCategory::Ambiguous:        return "ambig";
    }
    return "unknown";
}

int64_t QcFailureCounts::count(const std::string& name) const {
    for (int i = 0; i < NUM_QC_CATEGORIES; i++) {
        if (name == qc_category_name(static_cast<QcCategory>(i))) return counts_[i];
    }
    return 0;
}

int64_t QcFailureCounts::total() const {
    int64_t n = 0;
    for (auto c : counts_) n += c;
    return n;
}

std::map<std::string, int64_t> QcFailureCounts::as_map() const {
    std::map<std::string, int64_t> m;
    for (int i = 0; i < NUM_QC_CATEGORIES; i++) {
        m[qc_category_name(static_cast<QcCategory>(i))] = counts_[i];
    }
    return m;
}

bool QcResult::failed_category(QcCategory c) const {
    for (auto f : failed) {
        if (f == c) return true;
    }
    return false;
}

std::string QcResult::failed_names() const {
    std::string out;
    for (size_t i = 0; i < failed.size(); i++) {
        if (i > 0) out += ",";
        out += qc_category_name(failed[i]);
    }
    return out;
}

QcResult evaluate_qc(const MetadataRecord& rec, double marker_perc, const QcThresholds& t) {
    QcResult r;
    auto fail = [&r](QcCategory c) {
        r.failed.push_back(c);
        r.passed = false;
    };

    if (rec.checkm_completeness < t.min_comp) fail(QcCategory::Completeness);

    double q;
    if (rec.checkm_strain_heterogeneity_100 >= t.sh_exception) {
        if (rec.checkm_contamination > SH_MAX_CONTAMINATION) fail(QcCategory::Contamination);
        q = rec.checkm_completeness
            - 5.0 * rec.checkm_contamination * (1.0 - rec.checkm_strain_heterogeneity_100 / 100.0);
    } else {
        if (rec.checkm_contamination > t.max_cont) fail(QcCategory::Contamination);
        q = rec.checkm_completeness - 5.0 * rec.checkm_contamination;
    }
    if (q < t.min_quality) fail(QcCategory::Quality);

    if (marker_perc < t.min_perc_markers) fail(QcCategory::MarkerPercentage);
    if (rec.contig_count > t.max_contigs) fail(QcCategory::ContigCount);
    if (rec.n50_contigs < t.min_n50) fail(QcCategory::N50);
    if (rec.ambiguous_bases > t.max_ambiguous) fail(QcCategory::Ambiguous);

    return r;
}

bool pass_qc(const MetadataRecord& rec, double marker_perc, const QcThresholds& t,
             QcFailureCounts& counts) {
    QcResult r = evaluate_qc(rec, marker_perc, t);
    for (auto c : r.failed) counts.increment(c);
    return r.passed;
}

size_t QcBatchResult::num_passed() const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.passed) n++;
    }
    return n;
}

QcBatchResult run_qc(const std::vector<std::string>& gids,
                     const MetadataMap& metadata,
                     const std::map<std::string, double>& marker_perc,
                     const QcThresholds& t,
                     int threads) {
    const int n = static_cast<int>(gids.size());

    // Resolve inputs serially so lookups inside the parallel region cannot fail
    std::vector<const MetadataRecord*> records(n);
    std::vector<double> perc(n);
    for (int i = 0; i < n; i++) {
        auto rit = metadata.find(gids[i]);
        if (rit == metadata.end()) throw MissingFieldError(gids[i], "metadata record");
        auto pit = marker_perc.find(gids[i]);
        if (pit == marker_perc.end()) throw MissingFieldError(gids[i], "marker percentage");
        records[i] = &rit->second;
        perc[i] = pit->second;
    }

    QcBatchResult batch;
    batch.gids = gids;
    batch.results.resize(n);

    if (threads < 1) threads = 1;
    std::vector<QcFailureCounts> partial(threads);

    #pragma omp parallel num_threads(threads)
    {
        int tid = 0;
#ifdef _OPENMP
        tid = omp_get_thread_num();
#endif
        QcFailureCounts& local = partial[tid];

        #pragma omp for schedule(static)
        for (int i = 0; i < n; i++) {
            batch.results[i] = evaluate_qc(*records[i], perc[i], t);
            for (auto c : batch.results[i].failed) local.increment(c);
        }
    }

    for (const auto& p : partial) batch.failure_counts += p;
    return batch;
}

}  // namespace specter

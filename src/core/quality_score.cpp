// SPECTER - quality_score.cpp

#include "quality_score.h"
#include "errors.h"
#include "type_strain.h"
#include "../util/string_utils.h"

namespace specter {

bool is_complete_assembly(const MetadataRecord& rec) {
    const std::string level = to_lower(rec.ncbi_assembly_level);
    if (level != "complete genome" && level != "chromosome") return false;
    if (to_lower(rec.ncbi_genome_representation) != "full") return false;

    if (!rec.ncbi_molecule_count || rec.scaffold_count != *rec.ncbi_molecule_count) return false;
    if (!rec.ncbi_unspanned_gaps || *rec.ncbi_unspanned_gaps != 0) return false;
    // no spanned gap count does not rule out a complete assembly
    if (rec.ncbi_spanned_gaps && *rec.ncbi_spanned_gaps > 10) return false;

    return rec.ambiguous_bases <= 10000
        && rec.total_gap_length <= 10000
        && rec.ssu_count >= 1;
}

double genome_quality_score(const MetadataRecord& rec) {
    double q = is_complete_assembly(rec) ? 100.0 : 0.0;

    q += rec.checkm_completeness - 5.0 * rec.checkm_contamination;

    const std::string designation = to_lower(rec.ncbi_type_material_designation);
    if (NCBI_TYPE_SPECIES.count(designation)) q += 200.0;

    // proxytype or RefSeq representative/reference: one bonus, not two
    if (NCBI_PROXYTYPE.count(designation)
        || contains_ci(rec.ncbi_refseq_category, "representative")
        || contains_ci(rec.ncbi_refseq_category, "reference")) {
        q += 10.0;
    }

    q -= 5.0 * static_cast<double>(rec.contig_count) / 100.0;
    q -= 5.0 * static_cast<double>(rec.ambiguous_bases) / 1e5;

    if (contains_ci(rec.ncbi_genome_category, "metagenome")) q -= 200.0;
    if (contains_ci(rec.ncbi_genome_category, "single cell")) q -= 100.0;

    const int64_t min_ssu_len = rec.gtdb_domain() == "d__Archaea"
        ? MIN_SSU_LEN_ARCHAEA : MIN_SSU_LEN_DEFAULT;
    if (rec.ssu_length && *rec.ssu_length >= min_ssu_len) q += 10.0;

    return q;
}

std::map<std::string, double> quality_score(const std::vector<std::string>& gids,
                                            const MetadataMap& metadata) {
    std::map<std::string, double> score;
    for (const auto& gid : gids) {
        auto it = metadata.find(gid);
        if (it == metadata.end()) {
            throw MissingFieldError(gid, "metadata record");
        }
        score[gid] = genome_quality_score(it->second);
    }
    return score;
}

}  // namespace specter

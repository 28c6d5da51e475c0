// SPECTER - metadata_record.h
// Per-genome metadata fields consumed by scoring, QC and type classification

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace specter {

constexpr int NUM_RANKS = 7;
constexpr const char* RANK_PREFIXES[NUM_RANKS] = {"d__", "p__", "c__", "o__", "f__", "g__", "s__"};

using Taxonomy = std::array<std::string, NUM_RANKS>;

// Parse "d__Bacteria;p__...;s__Foo bar". Missing trailing ranks are filled
// with their bare prefix (e.g. "s__").
Taxonomy parse_taxonomy(const std::string& taxonomy_str);

struct MetadataRecord {
    std::string genome_id;

    Taxonomy gtdb_taxonomy;

    // CheckM estimates (%)
    double checkm_completeness = 0.0;
    double checkm_contamination = 0.0;
    double checkm_strain_heterogeneity_100 = 0.0;

    // Assembly statistics
    int64_t genome_size = 0;
    int64_t contig_count = 0;
    int64_t n50_contigs = 0;
    int64_t scaffold_count = 0;
    int64_t ambiguous_bases = 0;
    int64_t total_gap_length = 0;
    int64_t ssu_count = 0;
    std::optional<int64_t> ssu_length;

    // NCBI assembly fields; empty string / nullopt when NCBI has no value
    std::string ncbi_assembly_level;
    std::string ncbi_genome_representation;
    std::string ncbi_refseq_category;
    std::string ncbi_type_material_designation;
    std::optional<int64_t> ncbi_molecule_count;
    std::optional<int64_t> ncbi_unspanned_gaps;
    std::optional<int64_t> ncbi_spanned_gaps;
    std::string ncbi_genome_category;

    // GTDB curation fields
    std::string gtdb_type_designation;
    bool mimag_high_quality = false;
    bool gtdb_representative = false;
    std::vector<std::string> gtdb_clustered_genomes;

    const std::string& gtdb_domain() const { return gtdb_taxonomy[0]; }
    const std::string& gtdb_species() const { return gtdb_taxonomy[NUM_RANKS - 1]; }
};

using MetadataMap = std::map<std::string, MetadataRecord>;

}  // namespace specter

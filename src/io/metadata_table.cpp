// SPECTER - metadata_table.cpp

#include "metadata_table.h"
#include "table_reader.h"
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../util/string_utils.h"

#include <cmath>
#include <cstdlib>
#include <optional>

namespace specter {

const char* const REQUIRED_METADATA_FIELDS[] = {
    "gtdb_taxonomy",
    "checkm_completeness",
    "checkm_contamination",
    "checkm_strain_heterogeneity_100",
    "genome_size",
    "contig_count",
    "n50_contigs",
    "scaffold_count",
    "ambiguous_bases",
    "total_gap_length",
    "ssu_count",
    "ssu_length",
    "ncbi_assembly_level",
    "ncbi_genome_representation",
    "ncbi_refseq_category",
    "ncbi_type_material_designation",
    "ncbi_molecule_count",
    "ncbi_unspanned_gaps",
    "ncbi_spanned_gaps",
    "ncbi_genome_category",
    nullptr,
};

namespace {

bool is_null_value(const std::string& v) {
    std::string lv = to_lower(trim(v));
    return lv.empty() || lv == "none" || lv == "na" || lv == "n/a" || lv == "null";
}

// Column indices resolved once from the header
struct MetadataColumns {
    int genome = 0;
    int taxonomy, comp, cont, sh;
    int genome_size, contig_count, n50, scaffold_count, ambiguous, gap_length;
    int ssu_count, ssu_length;
    int assembly_level, representation, refseq_category, type_material;
    int molecule_count, unspanned_gaps, spanned_gaps, genome_category;
    int gtdb_type = -1, mimag_hq = -1, gtdb_rep = -1, clustered = -1;
};

class RowParser {
public:
    RowParser(const std::string& gid, const std::vector<std::string>& row, const std::string& path)
        : gid_(gid), row_(row), path_(path) {}

    std::string text(int idx) const {
        if (idx < 0) return "";
        const std::string v = trim(row_[idx]);
        return is_null_value(v) ? "" : v;
    }

    double real(int idx, const char* field) const {
        auto v = optional_real(idx, field);
        if (!v) throw MissingFieldError(gid_, field);
        return *v;
    }

    std::optional<double> optional_real(int idx, const char* field) const {
        if (idx < 0 || is_null_value(row_[idx])) return std::nullopt;
        const std::string v = trim(row_[idx]);
        char* end = nullptr;
        double d = std::strtod(v.c_str(), &end);
        if (end == v.c_str() || *end != '\0') {
            throw MalformedReportError(path_, "non-numeric " + std::string(field) +
                                       " '" + v + "' for genome " + gid_);
        }
        // strtod accepts nan and inf; neither is a usable value
        if (!std::isfinite(d)) return std::nullopt;
        return d;
    }

    int64_t integer(int idx, const char* field) const {
        return static_cast<int64_t>(real(idx, field));
    }

    std::optional<int64_t> optional_integer(int idx, const char* field) const {
        auto v = optional_real(idx, field);
        if (!v) return std::nullopt;
        return static_cast<int64_t>(*v);
    }

    bool boolean(int idx) const {
        std::string v = to_lower(text(idx));
        return v == "t" || v == "true" || v == "yes" || v == "1";
    }

private:
    const std::string& gid_;
    const std::vector<std::string>& row_;
    const std::string& path_;
};

int required_column(const TableReader& reader, const char* field) {
    int idx = reader.find_column(field);
    if (idx < 0) throw MissingFieldError("<all genomes>", field);
    return idx;
}

}  // namespace

MetadataMap read_gtdb_metadata(const std::string& path, bool keep_db_prefix) {
    TableReader reader(path);
    reader.read_header();

    // report the first absent column before any row is read
    for (int i = 0; REQUIRED_METADATA_FIELDS[i]; i++) {
        required_column(reader, REQUIRED_METADATA_FIELDS[i]);
    }

    MetadataColumns col;
    if (reader.find_column("accession") >= 0) col.genome = reader.find_column("accession");
    else if (reader.find_column("genome") >= 0) col.genome = reader.find_column("genome");

    col.taxonomy = required_column(reader, "gtdb_taxonomy");
    col.comp = required_column(reader, "checkm_completeness");
    col.cont = required_column(reader, "checkm_contamination");
    col.sh = required_column(reader, "checkm_strain_heterogeneity_100");
    col.genome_size = required_column(reader, "genome_size");
    col.contig_count = required_column(reader, "contig_count");
    col.n50 = required_column(reader, "n50_contigs");
    col.scaffold_count = required_column(reader, "scaffold_count");
    col.ambiguous = required_column(reader, "ambiguous_bases");
    col.gap_length = required_column(reader, "total_gap_length");
    col.ssu_count = required_column(reader, "ssu_count");
    col.ssu_length = required_column(reader, "ssu_length");
    col.assembly_level = required_column(reader, "ncbi_assembly_level");
    col.representation = required_column(reader, "ncbi_genome_representation");
    col.refseq_category = required_column(reader, "ncbi_refseq_category");
    col.type_material = required_column(reader, "ncbi_type_material_designation");
    col.molecule_count = required_column(reader, "ncbi_molecule_count");
    col.unspanned_gaps = required_column(reader, "ncbi_unspanned_gaps");
    col.spanned_gaps = required_column(reader, "ncbi_spanned_gaps");
    col.genome_category = required_column(reader, "ncbi_genome_category");
    col.gtdb_type = reader.find_column("gtdb_type_designation");
    col.mimag_hq = reader.find_column("mimag_high_quality");
    col.gtdb_rep = reader.find_column("gtdb_representative");
    col.clustered = reader.find_column("gtdb_clustered_genomes");

    MetadataMap metadata;
    std::vector<std::string> row;
    while (reader.next_row(row)) {
        const std::string raw_gid = trim(row[col.genome]);
        if (raw_gid.empty()) continue;

        MetadataRecord rec;
        rec.genome_id = canonical_genome_id(raw_gid, keep_db_prefix);
        RowParser p(rec.genome_id, row, path);

        const std::string taxonomy = p.text(col.taxonomy);
        if (taxonomy.empty()) throw MissingFieldError(rec.genome_id, "gtdb_taxonomy");
        rec.gtdb_taxonomy = parse_taxonomy(taxonomy);

        rec.checkm_completeness = p.real(col.comp, "checkm_completeness");
        rec.checkm_contamination = p.real(col.cont, "checkm_contamination");
        rec.checkm_strain_heterogeneity_100 = p.real(col.sh, "checkm_strain_heterogeneity_100");

        rec.genome_size = p.integer(col.genome_size, "genome_size");
        rec.contig_count = p.integer(col.contig_count, "contig_count");
        rec.n50_contigs = p.integer(col.n50, "n50_contigs");
        rec.scaffold_count = p.integer(col.scaffold_count, "scaffold_count");
        rec.ambiguous_bases = p.integer(col.ambiguous, "ambiguous_bases");
        rec.total_gap_length = p.integer(col.gap_length, "total_gap_length");
        rec.ssu_count = p.integer(col.ssu_count, "ssu_count");
        rec.ssu_length = p.optional_integer(col.ssu_length, "ssu_length");

        rec.ncbi_assembly_level = p.text(col.assembly_level);
        rec.ncbi_genome_representation = p.text(col.representation);
        rec.ncbi_refseq_category = p.text(col.refseq_category);
        rec.ncbi_type_material_designation = p.text(col.type_material);
        rec.ncbi_molecule_count = p.optional_integer(col.molecule_count, "ncbi_molecule_count");
        rec.ncbi_unspanned_gaps = p.optional_integer(col.unspanned_gaps, "ncbi_unspanned_gaps");
        rec.ncbi_spanned_gaps = p.optional_integer(col.spanned_gaps, "ncbi_spanned_gaps");
        rec.ncbi_genome_category = p.text(col.genome_category);

        rec.gtdb_type_designation = p.text(col.gtdb_type);
        rec.mimag_high_quality = p.boolean(col.mimag_hq);
        rec.gtdb_representative = p.boolean(col.gtdb_rep);
        for (const auto& g : split(p.text(col.clustered), ',')) {
            std::string id = trim(g);
            if (!id.empty()) rec.gtdb_clustered_genomes.push_back(canonical_genome_id(id, keep_db_prefix));
        }

        metadata[rec.genome_id] = std::move(rec);
    }

    return metadata;
}

}  // namespace specter

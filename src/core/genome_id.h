// SPECTER - genome_id.h
// Genome id origin prefixes (RS_, GB_, U_) handled in one place
//
// Ids are normalized once at ingestion. Everything downstream compares the
// form chosen there; GenomeIdIndex catches inputs that disagree on the form.

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace specter {

enum class GenomeOrigin { RefSeq, GenBank, User, Unknown };

struct GenomeId {
    std::string accession;   // id with the origin prefix removed
    GenomeOrigin origin = GenomeOrigin::Unknown;
};

const char* origin_prefix(GenomeOrigin origin);

// Split a leading RS_/GB_/U_ prefix from the accession
GenomeId parse_genome_id(std::string_view raw);

// Stripped accession, or raw id unchanged when keep_db_prefix is set
std::string canonical_genome_id(std::string_view raw, bool keep_db_prefix);

// GCF_xxx -> RS_GCF_xxx, GCA_xxx -> GB_GCA_xxx (NCBI assembly summaries)
std::string ncbi_accession_to_gid(std::string_view accession);

inline bool is_user_genome(std::string_view raw) {
    return parse_genome_id(raw).origin == GenomeOrigin::User;
}

// Ids of a reference input (normally the metadata table), used to resolve ids
// arriving from other inputs
class GenomeIdIndex {
public:
    GenomeIdIndex() = default;
    explicit GenomeIdIndex(const std::vector<std::string>& ids);

    void add(const std::string& id);

    bool contains(const std::string& id) const { return ids_.count(id) > 0; }
    size_t size() const { return ids_.size(); }

    // Returns id when it is known under exactly this form.
    // Throws InconsistentIdError when only a differently prefixed form is known.
    // Unknown ids are returned as-is.
    const std::string& resolve(const std::string& id, const std::string& source) const;

private:
    // id -> accession
    std::unordered_map<std::string, std::string> ids_;
    // accession -> id form that was registered
    std::unordered_map<std::string, std::string> by_accession_;
};

}  // namespace specter

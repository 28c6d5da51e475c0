// SPECTER - genome_id.cpp

#include "genome_id.h"
#include "errors.h"

namespace specter {

namespace {

struct PrefixEntry {
    const char* prefix;
    GenomeOrigin origin;
};

constexpr PrefixEntry PREFIXES[] = {
    {"RS_", GenomeOrigin::RefSeq},
    {"GB_", GenomeOrigin::GenBank},
    {"U_", GenomeOrigin::User},
};

}  // namespace

const char* origin_prefix(GenomeOrigin origin) {
    switch (origin) {
        case GenomeOrigin::RefSeq:  return "RS_";
        case GenomeOrigin::GenBank: return "GB_";
        case GenomeOrigin::User:    return "U_";
        default:                    return "";
    }
}

GenomeId parse_genome_id(std::string_view raw) {
    for (const auto& p : PREFIXES) {
        std::string_view prefix(p.prefix);
        if (raw.size() > prefix.size() && raw.substr(0, prefix.size()) == prefix) {
            return {std::string(raw.substr(prefix.size())), p.origin};
        }
    }
    return {std::string(raw), GenomeOrigin::Unknown};
}

std::string canonical_genome_id(std::string_view raw, bool keep_db_prefix) {
    if (keep_db_prefix) return std::string(raw);
    return parse_genome_id(raw).accession;
}

std::string ncbi_accession_to_gid(std::string_view accession) {
    if (accession.substr(0, 4) == "GCF_") return "RS_" + std::string(accession);
    if (accession.substr(0, 4) == "GCA_") return "GB_" + std::string(accession);
    return std::string(accession);
}

GenomeIdIndex::GenomeIdIndex(const std::vector<std::string>& ids) {
    for (const auto& id : ids) add(id);
}

void GenomeIdIndex::add(const std::string& id) {
    GenomeId parsed = parse_genome_id(id);
    auto it = by_accession_.find(parsed.accession);
    if (it != by_accession_.end() && it->second != id) {
        throw InconsistentIdError(id, it->second, "id index");
    }
    ids_[id] = parsed.accession;
    by_accession_[parsed.accession] = id;
}

const std::string& GenomeIdIndex::resolve(const std::string& id,
                                          const std::string& source) const {
    if (ids_.count(id)) return id;

    auto it = by_accession_.find(parse_genome_id(id).accession);
    if (it != by_accession_.end()) {
        throw InconsistentIdError(id, it->second, source);
    }
    return id;
}

}  // namespace specter

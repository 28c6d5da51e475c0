// SPECTER - type_strain.cpp

#include "type_strain.h"

#include <sstream>
#include <vector>

namespace specter {

const std::set<std::string> NCBI_TYPE_SPECIES = {
    "assembly from type material",
    "assembly from neotype material",
    "assembly designated as neotype",
};
const std::set<std::string> NCBI_PROXYTYPE = {"assembly from proxytype material"};
const std::set<std::string> NCBI_TYPE_SUBSP = {"assembly from synonym type material"};

const std::set<std::string> GTDB_TYPE_SPECIES = {"type strain of species", "type strain of neotype"};
const std::set<std::string> GTDB_TYPE_SUBSPECIES = {"type strain of subspecies",
                                                    "type strain of heterotypic synonym"};
const std::set<std::string> GTDB_NOT_TYPE_MATERIAL = {"not type material"};

bool is_ncbi_type_species(const MetadataRecord& rec) {
    return NCBI_TYPE_SPECIES.count(rec.ncbi_type_material_designation) > 0;
}

bool is_gtdb_type_species(const MetadataRecord& rec) {
    return GTDB_TYPE_SPECIES.count(rec.gtdb_type_designation) > 0;
}

std::set<std::string> ncbi_type_strain_of_species(const MetadataMap& metadata) {
    std::set<std::string> type_gids;
    for (const auto& [gid, rec] : metadata) {
        if (is_ncbi_type_species(rec)) type_gids.insert(gid);
    }
    return type_gids;
}

std::set<std::string> gtdb_type_strain_of_species(const MetadataMap& metadata) {
    std::set<std::string> type_gids;
    for (const auto& [gid, rec] : metadata) {
        if (is_gtdb_type_species(rec)) type_gids.insert(gid);
    }
    return type_gids;
}

std::string parse_canonical_sp(const std::string& sp) {
    std::string name = sp;
    const std::string candidatus = "Candidatus ";
    size_t pos;
    while ((pos = name.find(candidatus)) != std::string::npos) {
        name.erase(pos, candidatus.size());
    }

    std::istringstream iss(name);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w && words.size() < 2) words.push_back(w);

    if (words.empty()) return "";
    if (words.size() == 1) return words[0];
    return words[0] + " " + words[1];
}

}  // namespace specter

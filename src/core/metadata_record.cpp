// SPECTER - metadata_record.cpp

#include "metadata_record.h"
#include "../util/string_utils.h"

namespace specter {

Taxonomy parse_taxonomy(const std::string& taxonomy_str) {
    Taxonomy taxa;
    std::vector<std::string> ranks = split(taxonomy_str, ';');
    for (int r = 0; r < NUM_RANKS; r++) {
        if (r < static_cast<int>(ranks.size()) && !trim(ranks[r]).empty()) {
            taxa[r] = trim(ranks[r]);
        } else {
            taxa[r] = RANK_PREFIXES[r];
        }
    }
    return taxa;
}

}  // namespace specter

// SPECTER - ani_reconciler.cpp

#include "ani_reconciler.h"

#include <algorithm>

namespace specter {

void AniAfMatrix::set(const std::string& query, const std::string& ref, double ani, double af) {
    values_[{query, ref}] = AniAf{ani, af};
}

std::optional<AniAf> AniAfMatrix::get(const std::string& query, const std::string& ref) const {
    auto it = values_.find({query, ref});
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool AniAfMatrix::contains(const std::string& query, const std::string& ref) const {
    return values_.count({query, ref}) > 0;
}

std::set<std::string> AniAfMatrix::genome_ids() const {
    std::set<std::string> ids;
    for (const auto& [key, v] : values_) {
        ids.insert(key.first);
        ids.insert(key.second);
    }
    return ids;
}

AniAf symmetric_ani(const AniAfMatrix& m, const std::string& gid1, const std::string& gid2) {
    auto fwd = m.get(gid1, gid2);
    auto rev = m.get(gid2, gid1);
    if (!fwd || !rev) return AniAf{0.0, 0.0};

    // ANI and AF may come from different directions
    return AniAf{std::max(fwd->ani, rev->ani), std::max(fwd->af, rev->af)};
}

}  // namespace specter

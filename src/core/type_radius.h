// SPECTER - type_radius.h
// Nearest other-species representative for each type genome

#pragma once

#include "ani_reconciler.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace specter {

struct TypeRadius {
    double ani = 0.0;
    std::optional<double> af;
    std::optional<std::string> neighbour_gid;  // nullopt: no related representative
};

using TypeRadiusMap = std::map<std::string, TypeRadius>;

// For every representative, the other representative with the highest
// symmetric ANI (lowest id on ties). Pairs with ANI 0 are unrelated.
TypeRadiusMap compute_type_radius(const std::vector<std::string>& rep_ids,
                                  const AniAfMatrix& ani_af,
                                  int threads = 1);

}  // namespace specter

// SPECTER - ani_table.h
// Directional ANI/AF table produced by an external alignment tool

#pragma once

#include "../core/ani_reconciler.h"

#include <string>

namespace specter {

class GenomeIdIndex;

// Read a tab-separated table with columns Query, Reference, ANI, AF.
// When index is given every id is resolved against it, so an id that the
// index knows under a different origin prefix raises InconsistentIdError.
AniAfMatrix read_ani_af_table(const std::string& path, const GenomeIdIndex* index = nullptr);

}  // namespace specter

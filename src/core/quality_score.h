// SPECTER - quality_score.h
// Additive quality score used to rank genomes when choosing a representative
//
// Rewards complete, gap-free NCBI assemblies, type material and a near
// full-length 16S rRNA gene; penalizes contamination, fragmentation,
// ambiguous bases and MAG/SAG origin. Higher is better, no fixed range.

#pragma once

#include "metadata_record.h"

#include <map>
#include <string>
#include <vector>

namespace specter {

// Minimum 16S rRNA length counted as near full-length
constexpr int64_t MIN_SSU_LEN_ARCHAEA = 900;
constexpr int64_t MIN_SSU_LEN_DEFAULT = 1200;

// True if the assembly consists only of unspanned chromosome(s) and plasmids
bool is_complete_assembly(const MetadataRecord& rec);

double genome_quality_score(const MetadataRecord& rec);

// Score every genome in gids; throws MissingFieldError for a gid without a record
std::map<std::string, double> quality_score(const std::vector<std::string>& gids,
                                            const MetadataMap& metadata);

}  // namespace specter

// SPECTER - cluster_report.h
// Species cluster and type radius reports (tab-separated, header mandatory)
//
// Cluster file columns:
//   NCBI species, Type genome, No. clustered genomes, Mean ANI, Min ANI,
//   Mean AF, Min AF, Clustered genomes
// Type radius file columns:
//   NCBI species, Type genome, ANI, AF, Closest species, Closest type genome
//
// Genome ids are written and read verbatim. Readers locate columns by name.

#pragma once

#include "../core/type_radius.h"

#include <map>
#include <string>
#include <vector>

namespace specter {

class GenomeIdIndex;

constexpr const char* UNCLASSIFIED_SPECIES = "unclassified";
constexpr const char* NOT_APPLICABLE = "N/A";

struct ClusteredGenome {
    std::string gid;
    double ani = 0.0;
    double af = 0.0;
};

// representative id -> clustered genomes
using ClusterMap = std::map<std::string, std::vector<ClusteredGenome>>;
// genome id -> species label
using SpeciesMap = std::map<std::string, std::string>;

struct ClusterTable {
    std::map<std::string, std::vector<std::string>> clusters;
    SpeciesMap species;
};

std::string format_fixed(double value, int precision = 2);

// Rows sorted by descending cluster size, ties by representative id
void write_clusters(const ClusterMap& clusters, const SpeciesMap& species,
                    const std::string& path);

ClusterTable read_clusters(const std::string& path);

// Register every representative and member id of table in index. An id the
// index already knows under another origin prefix raises InconsistentIdError.
void add_cluster_ids(const ClusterTable& table, GenomeIdIndex& index, const std::string& source);

void write_type_radius(const TypeRadiusMap& type_radius, const SpeciesMap& species,
                       const std::string& path);

TypeRadiusMap read_type_radius(const std::string& path, SpeciesMap* species = nullptr);

}  // namespace specter

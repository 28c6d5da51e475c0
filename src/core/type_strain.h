// SPECTER - type_strain.h
// Type material vocabularies used by NCBI and GTDB
//
// The two vocabularies are independent and sometimes disagree. Classification
// here is set membership only; preferring one over the other is up to callers.

#pragma once

#include "metadata_record.h"

#include <set>
#include <string>

namespace specter {

// NCBI type material designations
extern const std::set<std::string> NCBI_TYPE_SPECIES;
extern const std::set<std::string> NCBI_PROXYTYPE;
extern const std::set<std::string> NCBI_TYPE_SUBSP;

// GTDB type designations
extern const std::set<std::string> GTDB_TYPE_SPECIES;
extern const std::set<std::string> GTDB_TYPE_SUBSPECIES;
extern const std::set<std::string> GTDB_NOT_TYPE_MATERIAL;

// Exact (case-sensitive) membership tests
bool is_ncbi_type_species(const MetadataRecord& rec);
bool is_gtdb_type_species(const MetadataRecord& rec);

// Genomes NCBI considers type strain of their species
std::set<std::string> ncbi_type_strain_of_species(const MetadataMap& metadata);

// Genomes GTDB considers type strain of their species
std::set<std::string> gtdb_type_strain_of_species(const MetadataMap& metadata);

// Canonical binomial: "Candidatus Foo bar subsp. baz" -> "Foo bar"
std::string parse_canonical_sp(const std::string& sp);

}  // namespace specter

// SPECTER - genome_lists.h
// Genome id lists and per-genome notes from auxiliary inputs

#pragma once

#include <map>
#include <set>
#include <string>

namespace specter {

// Genomes passing QC: ids in the first column, after a header line
std::set<std::string> read_qc_file(const std::string& path);

struct GenomeIdLists {
    std::set<std::string> ncbi;
    std::set<std::string> user;   // U_ prefixed ids
};

// One id per line (first tab- or whitespace-delimited token), '#' comments
GenomeIdLists read_genome_id_file(const std::string& path);

// "excluded_from_refseq" note per genome from NCBI assembly summary files.
// Accessions are converted to RS_/GB_ genome ids. Either path may be empty.
std::map<std::string, std::string> exclude_from_refseq(const std::string& refseq_assembly_file,
                                                       const std::string& genbank_assembly_file);

}  // namespace specter

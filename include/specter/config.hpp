// SPECTER - Centralized Configuration Structures
// All command configs in one place for consistency
#ifndef SPECTER_CONFIG_HPP
#define SPECTER_CONFIG_HPP

#include <cstdint>
#include <string>
#include "specter/version.h"

namespace specter {

// Global version for all SPECTER tools (set by cmake from the project version)
constexpr const char* VERSION = SPECTER_VERSION_STRING;

// Genome quality control configuration
// Threshold defaults are the GTDB release criteria
struct QcConfig {
    std::string metadata_file;
    std::string marker_report;         // gtdb domain report
    std::string refseq_assembly_file;  // NCBI assembly_summary_refseq.txt (optional)
    std::string genbank_assembly_file; // NCBI assembly_summary_genbank.txt (optional)
    std::string genome_id_file;        // restrict QC to these genomes (optional)
    std::string output_dir;
    std::string trace_file;

    double min_comp = 50.0;            // Minimum CheckM completeness (%)
    double max_cont = 10.0;            // Maximum CheckM contamination (%)
    double min_quality = 50.0;         // Minimum completeness - 5*contamination
    double sh_exception = 80.0;        // Strain heterogeneity (%) that relaxes contamination
    double min_perc_markers = 40.0;    // Minimum marker genes identified (%)
    int64_t max_contigs = 1000;
    int64_t min_n50 = 5000;
    int64_t max_ambiguous = 100000;

    int threads = 1;
    bool verbose = false;
};

// Quality ranking / representative preference configuration
struct RankConfig {
    std::string metadata_file;
    std::string qc_file;               // genomes passing QC (optional)
    std::string output_file;
    std::string trace_file;
    bool keep_db_prefix = true;
    bool verbose = false;
};

// Type radius configuration
struct RadiusConfig {
    std::string cluster_file;          // representatives are read from here
    std::string ani_file;
    std::string metadata_file;         // optional: validates ids against metadata
    std::string output_file;
    std::string trace_file;
    int threads = 1;
    bool verbose = false;
};

// Cluster statistics configuration
struct ClustersConfig {
    std::string cluster_file;
    std::string ani_file;
    std::string output_file;
    std::string trace_file;
    bool verbose = false;
};

}  // namespace specter

#endif  // SPECTER_CONFIG_HPP

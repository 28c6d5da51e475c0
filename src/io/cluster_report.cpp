// SPECTER - cluster_report.cpp

#include "cluster_report.h"
#include "table_reader.h"
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../util/string_utils.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace specter {

namespace {

const std::string& species_of(const SpeciesMap& species, const std::string& gid) {
    static const std::string unclassified = UNCLASSIFIED_SPECIES;
    auto it = species.find(gid);
    return it == species.end() ? unclassified : it->second;
}

double parse_real(const std::string& v, const TableReader& reader) {
    const std::string s = trim(v);
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0') {
        throw MalformedReportError(reader.path(), "invalid number '" + s + "' at line " +
                                   std::to_string(reader.line_number()));
    }
    return d;
}

}  // namespace

std::string format_fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

void write_clusters(const ClusterMap& clusters, const SpeciesMap& species,
                    const std::string& path) {
    std::ofstream out(path);
    if (!out) throw SpecterError("Failed to open output file: " + path);

    out << "NCBI species\tType genome\tNo. clustered genomes\tMean ANI\tMin ANI"
        << "\tMean AF\tMin AF\tClustered genomes\n";

    std::vector<const ClusterMap::value_type*> order;
    order.reserve(clusters.size());
    for (const auto& entry : clusters) order.push_back(&entry);
    std::stable_sort(order.begin(), order.end(), [](const auto* a, const auto* b) {
        return a->second.size() > b->second.size();
    });

    for (const auto* entry : order) {
        const std::string& rid = entry->first;
        const auto& members = entry->second;

        std::string mean_ani = NOT_APPLICABLE, min_ani = NOT_APPLICABLE;
        std::string mean_af = NOT_APPLICABLE, min_af = NOT_APPLICABLE;
        std::vector<std::string> member_ids;

        if (!members.empty()) {
            double sum_ani = 0.0, sum_af = 0.0;
            double lo_ani = members[0].ani, lo_af = members[0].af;
            for (const auto& m : members) {
                sum_ani += m.ani;
                sum_af += m.af;
                lo_ani = std::min(lo_ani, m.ani);
                lo_af = std::min(lo_af, m.af);
                member_ids.push_back(m.gid);
            }
            mean_ani = format_fixed(sum_ani / members.size());
            min_ani = format_fixed(lo_ani);
            mean_af = format_fixed(sum_af / members.size());
            min_af = format_fixed(lo_af);
        }

        out << species_of(species, rid) << '\t'
            << rid << '\t'
            << members.size() << '\t'
            << mean_ani << '\t' << min_ani << '\t'
            << mean_af << '\t' << min_af << '\t'
            << join(member_ids, ",") << '\n';
    }

    if (!out) throw SpecterError("Failed writing cluster file: " + path);
}

ClusterTable read_clusters(const std::string& path) {
    TableReader reader(path);
    reader.read_header('\t');

    const int sp_idx = reader.column("NCBI species");
    const int rid_idx = reader.column("Type genome");
    const int num_idx = reader.column("No. clustered genomes");
    const int members_idx = reader.column("Clustered genomes");

    ClusterTable table;
    std::vector<std::string> row;
    while (reader.next_row(row)) {
        const std::string rid = trim(row[rid_idx]);
        table.species[rid] = trim(row[sp_idx]);

        const std::string num_str = trim(row[num_idx]);
        char* end = nullptr;
        long num_clustered = std::strtol(num_str.c_str(), &end, 10);
        if (num_str.empty() || *end != '\0' || num_clustered < 0) {
            throw MalformedReportError(path, "invalid cluster size '" + num_str +
                                       "' for " + rid);
        }

        std::vector<std::string>& members = table.clusters[rid];
        if (num_clustered > 0) {
            for (const auto& g : split(row[members_idx], ',')) {
                members.push_back(trim(g));
            }
            if (static_cast<long>(members.size()) != num_clustered) {
                throw MalformedReportError(path, "cluster of " + rid + " lists " +
                                           std::to_string(members.size()) + " genomes, expected " +
                                           num_str);
            }
        }
    }

    return table;
}

void add_cluster_ids(const ClusterTable& table, GenomeIdIndex& index, const std::string& source) {
    for (const auto& [rid, members] : table.clusters) {
        index.add(index.resolve(rid, source));
        for (const auto& gid : members) index.add(index.resolve(gid, source));
    }
}

void write_type_radius(const TypeRadiusMap& type_radius, const SpeciesMap& species,
                       const std::string& path) {
    std::ofstream out(path);
    if (!out) throw SpecterError("Failed to open output file: " + path);

    out << "NCBI species\tType genome\tANI\tAF\tClosest species\tClosest type genome\n";
    for (const auto& [gid, r] : type_radius) {
        std::string neighbour_sp = NOT_APPLICABLE;
        std::string neighbour_gid = NOT_APPLICABLE;
        if (r.neighbour_gid) {
            neighbour_gid = *r.neighbour_gid;
            neighbour_sp = species_of(species, neighbour_gid);
        }

        out << species_of(species, gid) << '\t'
            << gid << '\t'
            << format_fixed(r.ani) << '\t'
            << format_fixed(r.af.value_or(0.0)) << '\t'
            << neighbour_sp << '\t'
            << neighbour_gid << '\n';
    }

    if (!out) throw SpecterError("Failed writing type radius file: " + path);
}

TypeRadiusMap read_type_radius(const std::string& path, SpeciesMap* species) {
    TableReader reader(path);
    reader.read_header('\t');

    const int sp_idx = reader.column("NCBI species");
    const int gid_idx = reader.column("Type genome");
    const int ani_idx = reader.column("ANI");
    const int af_idx = reader.column("AF");
    const int nsp_idx = reader.column("Closest species");
    const int ngid_idx = reader.column("Closest type genome");

    TypeRadiusMap radius;
    std::vector<std::string> row;
    while (reader.next_row(row)) {
        const std::string gid = trim(row[gid_idx]);

        TypeRadius r;
        r.ani = parse_real(row[ani_idx], reader);
        r.af = parse_real(row[af_idx], reader);
        const std::string neighbour = trim(row[ngid_idx]);
        if (neighbour != NOT_APPLICABLE && !neighbour.empty()) {
            r.neighbour_gid = neighbour;
            if (species) (*species)[neighbour] = trim(row[nsp_idx]);
        }
        radius[gid] = r;

        if (species) (*species)[gid] = trim(row[sp_idx]);
    }

    return radius;
}

}  // namespace specter

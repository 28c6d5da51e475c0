// SPECTER - marker_report.cpp

#include "marker_report.h"
#include "table_reader.h"
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../util/string_utils.h"

#include <cstdlib>

namespace specter {

std::map<std::string, double> parse_marker_percentages(const std::string& path,
                                                       bool keep_db_prefix) {
    TableReader reader(path);
    reader.read_header('\t');

    const int domain_idx = reader.column("Predicted domain");
    const int bac_idx = reader.column("Bacterial Marker Percentage");
    const int ar_idx = reader.column("Archaeal Marker Percentage");

    std::map<std::string, double> marker_perc;
    std::vector<std::string> row;
    while (reader.next_row(row)) {
        const std::string gid = canonical_genome_id(trim(row[0]), keep_db_prefix);
        const std::string domain = trim(row[domain_idx]);
        const std::string value = trim(domain == "d__Bacteria" ? row[bac_idx] : row[ar_idx]);

        char* end = nullptr;
        double perc = std::strtod(value.c_str(), &end);
        if (value.empty() || *end != '\0') {
            throw MalformedReportError(path, "invalid marker percentage '" + value +
                                       "' for genome " + gid + " at line " +
                                       std::to_string(reader.line_number()));
        }
        marker_perc[gid] = perc;
    }

    return marker_perc;
}

}  // namespace specter

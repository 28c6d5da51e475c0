// SPECTER - ani_table.cpp

#include "ani_table.h"
#include "table_reader.h"
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../util/string_utils.h"

#include <cstdlib>

namespace specter {

namespace {

double parse_value(const std::string& v, const std::string& path, const TableReader& reader) {
    const std::string s = trim(v);
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (s.empty() || *end != '\0') {
        throw MalformedReportError(path, "invalid value '" + s + "' at line " +
                                   std::to_string(reader.line_number()));
    }
    return d;
}

}  // namespace

AniAfMatrix read_ani_af_table(const std::string& path, const GenomeIdIndex* index) {
    TableReader reader(path);
    reader.read_header('\t');

    const int query_idx = reader.column("Query");
    const int ref_idx = reader.column("Reference");
    const int ani_idx = reader.column("ANI");
    const int af_idx = reader.column("AF");

    AniAfMatrix m;
    std::vector<std::string> row;
    while (reader.next_row(row)) {
        std::string query = trim(row[query_idx]);
        std::string ref = trim(row[ref_idx]);
        if (index) {
            query = index->resolve(query, path);
            ref = index->resolve(ref, path);
        }
        m.set(query, ref, parse_value(row[ani_idx], path, reader), parse_value(row[af_idx], path, reader));
    }
    return m;
}

}  // namespace specter

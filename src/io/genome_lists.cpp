// SPECTER - genome_lists.cpp

#include "genome_lists.h"
#include "table_reader.h"
#include "../core/errors.h"
#include "../core/genome_id.h"
#include "../util/string_utils.h"

#include <sstream>

namespace specter {

std::set<std::string> read_qc_file(const std::string& path) {
    TableReader reader(path);
    reader.read_header('\t');

    std::set<std::string> passed_qc;
    std::vector<std::string> row;
    while (reader.next_row(row)) {
        const std::string gid = trim(row[0]);
        if (!gid.empty()) passed_qc.insert(gid);
    }
    return passed_qc;
}

GenomeIdLists read_genome_id_file(const std::string& path) {
    TableReader reader(path);

    GenomeIdLists lists;
    std::string line;
    while (reader.next_line(line)) {
        if (line.empty() || line[0] == '#') continue;

        std::string gid;
        if (line.find('\t') != std::string::npos) {
            gid = trim(line.substr(0, line.find('\t')));
        } else {
            std::istringstream iss(line);
            iss >> gid;
        }
        if (gid.empty()) continue;

        if (is_user_genome(gid)) lists.user.insert(gid);
        else lists.ncbi.insert(gid);
    }
    return lists;
}

std::map<std::string, std::string> exclude_from_refseq(const std::string& refseq_assembly_file,
                                                       const std::string& genbank_assembly_file) {
    std::map<std::string, std::string> excluded;

    for (const auto& path : {refseq_assembly_file, genbank_assembly_file}) {
        if (path.empty()) continue;

        TableReader reader(path);
        int exclude_idx = -1;
        std::string line;
        while (reader.next_line(line)) {
            if (line.empty()) continue;
            if (line[0] == '#') {
                if (line.rfind("# assembly_accession", 0) == 0) {
                    reader.set_header(line, '\t');
                    exclude_idx = reader.column("excluded_from_refseq");
                }
                continue;
            }
            if (exclude_idx < 0) {
                throw MalformedReportError(path, "data before '# assembly_accession' header");
            }

            std::vector<std::string> fields = split(line, '\t');
            const std::string gid = ncbi_accession_to_gid(fields[0]);
            excluded[gid] = exclude_idx < static_cast<int>(fields.size()) ? fields[exclude_idx] : "";
        }
    }

    return excluded;
}

}  // namespace specter

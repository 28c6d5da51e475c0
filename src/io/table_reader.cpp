// SPECTER - table_reader.cpp

#include "table_reader.h"
#include "../core/errors.h"

#include <cstring>

namespace specter {

std::vector<std::string> split_delimited(const std::string& line, char delim) {
    std::vector<std::string> fields;
    if (delim != ',') {
        size_t start = 0;
        while (true) {
            size_t pos = line.find(delim, start);
            if (pos == std::string::npos) {
                fields.push_back(line.substr(start));
                break;
            }
            fields.push_back(line.substr(start, pos - start));
            start = pos + 1;
        }
        return fields;
    }

    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    i++;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

TableReader::TableReader(const std::string& path) : path_(path) {
    // gzopen reads uncompressed files transparently
    gz_file_ = gzopen(path.c_str(), "r");
    if (!gz_file_) {
        throw SpecterError("Failed to open table: " + path);
    }
    gzbuffer(gz_file_, 262144);
}

TableReader::~TableReader() {
    if (gz_file_) gzclose(gz_file_);
}

bool TableReader::next_line(std::string& line) {
    line.clear();
    bool got_any = false;
    while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
        got_any = true;
        size_t len = strlen(buffer_);
        line.append(buffer_, len);
        if (len > 0 && buffer_[len - 1] == '\n') break;
    }
    if (!got_any) {
        int errnum = 0;
        const char* msg = gzerror(gz_file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw SpecterError("Failed to read " + path_ + ": " + msg);
        }
        return false;
    }

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    line_number_++;
    return true;
}

void TableReader::read_header(char delim) {
    std::string line;
    if (!next_line(line)) {
        throw MalformedReportError(path_, "missing header line");
    }
    if (delim == 0) {
        delim = line.find('\t') != std::string::npos ? '\t' : ',';
    }
    set_header(line, delim);
}

void TableReader::set_header(const std::string& header_line, char delim) {
    delim_ = delim;
    header_ = split_delimited(header_line, delim);
    column_index_.clear();
    for (size_t i = 0; i < header_.size(); i++) {
        // first occurrence wins on duplicate names
        column_index_.emplace(header_[i], static_cast<int>(i));
    }
}

int TableReader::find_column(const std::string& name) const {
    auto it = column_index_.find(name);
    return it == column_index_.end() ? -1 : it->second;
}

int TableReader::column(const std::string& name) const {
    int idx = find_column(name);
    if (idx < 0) {
        throw MalformedReportError(path_, "missing column '" + name + "'");
    }
    return idx;
}

bool TableReader::next_row(std::vector<std::string>& fields) {
    std::string line;
    while (next_line(line)) {
        if (line.empty()) continue;
        fields = split_delimited(line, delim_);
        if (fields.size() < header_.size()) fields.resize(header_.size());
        return true;
    }
    return false;
}

}  // namespace specter

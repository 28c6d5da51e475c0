// SPECTER - table_reader.h
// Delimited table reader with gzip support and header lookup by column name
//
// Columns are always addressed by header name, never by position, so
// reordered inputs read the same. Works on plain and gzipped files.

#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <zlib.h>

namespace specter {

// Split one line. Comma-delimited lines honour double-quoted fields
// ("a,b" and "" escapes); other delimiters split verbatim.
std::vector<std::string> split_delimited(const std::string& line, char delim);

class TableReader {
public:
    explicit TableReader(const std::string& path);
    ~TableReader();

    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    // Next raw line without trailing newline; false at end of file
    bool next_line(std::string& line);

    // Read the next line as header. delim 0 detects tab vs comma.
    // Throws MalformedReportError on an empty file.
    void read_header(char delim = 0);

    // Use an already-read line as header (e.g. a commented header)
    void set_header(const std::string& header_line, char delim);

    const std::vector<std::string>& header() const { return header_; }
    char delimiter() const { return delim_; }

    // Column index; -1 when absent
    int find_column(const std::string& name) const;

    // Column index; throws MalformedReportError when absent
    int column(const std::string& name) const;

    // Next non-empty data row; rows shorter than the header are padded with "".
    bool next_row(std::vector<std::string>& fields);

    const std::string& path() const { return path_; }
    size_t line_number() const { return line_number_; }

private:
    std::string path_;
    gzFile gz_file_;
    char buffer_[65536];
    size_t line_number_ = 0;
    char delim_ = '\t';
    std::vector<std::string> header_;
    std::unordered_map<std::string, int> column_index_;
};

}  // namespace specter

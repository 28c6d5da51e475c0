// SPECTER - errors.h
// Typed errors raised by the decision engine and its table readers

#pragma once

#include <stdexcept>
#include <string>

namespace specter {

class SpecterError : public std::runtime_error {
public:
    explicit SpecterError(const std::string& msg) : std::runtime_error(msg) {}
};

// A required metadata field (or the whole record) is absent for a genome
class MissingFieldError : public SpecterError {
public:
    MissingFieldError(const std::string& genome_id, const std::string& field)
        : SpecterError("Missing field '" + field + "' for genome " + genome_id),
          genome_id_(genome_id), field_(field) {}

    const std::string& genome_id() const { return genome_id_; }
    const std::string& field() const { return field_; }

private:
    std::string genome_id_;
    std::string field_;
};

// A report lacks an expected header column or has an unparsable row
class MalformedReportError : public SpecterError {
public:
    MalformedReportError(const std::string& path, const std::string& detail)
        : SpecterError("Malformed report " + path + ": " + detail),
          path_(path), detail_(detail) {}

    const std::string& path() const { return path_; }
    const std::string& detail() const { return detail_; }

private:
    std::string path_;
    std::string detail_;
};

// Same genome seen with a different origin-prefix form in two inputs
class InconsistentIdError : public SpecterError {
public:
    InconsistentIdError(const std::string& genome_id, const std::string& known_as,
                        const std::string& source)
        : SpecterError("Genome " + genome_id + " in " + source +
                       " is known as " + known_as + " elsewhere"),
          genome_id_(genome_id), known_as_(known_as), source_(source) {}

    const std::string& genome_id() const { return genome_id_; }
    const std::string& known_as() const { return known_as_; }
    const std::string& source() const { return source_; }

private:
    std::string genome_id_;
    std::string known_as_;
    std::string source_;
};

}  // namespace specter

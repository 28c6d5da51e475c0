// SPECTER - metadata_table.h
// Builds MetadataRecords from a GTDB metadata dump (CSV or TSV, optionally gzipped)

#pragma once

#include "../core/metadata_record.h"

#include <string>

namespace specter {

// Columns every metadata table must carry. A column listed here that is
// missing from the header, or a required value that is empty / "none",
// raises MissingFieldError naming the field.
extern const char* const REQUIRED_METADATA_FIELDS[];

// Read all genomes from the metadata table. Genome ids come from the
// "accession" or "genome" column (else the first column) and have their
// RS_/GB_/U_ prefix stripped unless keep_db_prefix is set.
MetadataMap read_gtdb_metadata(const std::string& path, bool keep_db_prefix = true);

}  // namespace specter

// SPECTER - marker_report.h
// Percentage of domain-specific marker genes identified in each genome

#pragma once

#include <map>
#include <string>

namespace specter {

// Parse a GTDB domain report. The genome id is the first column; the
// "Predicted domain" column selects "Bacterial Marker Percentage" for
// d__Bacteria and "Archaeal Marker Percentage" otherwise.
// A missing column raises MalformedReportError before any row is read.
std::map<std::string, double> parse_marker_percentages(const std::string& path,
                                                       bool keep_db_prefix = true);

}  // namespace specter

#pragma once
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/Types.hpp"

namespace sai {

// Parses manifest.json. Throws IndexerError(MalformedManifest) on invalid
// JSON or a missing/mistyped required field.
BundleManifest parse_manifest(std::string_view bytes);

// Parses one scanprint line. Throws nlohmann::json::exception.
ScanRecord parse_scan_record(std::string_view line);

// Parses a newline-delimited scanprint stream; blank lines are skipped.
// Any bad line throws IndexerError(MalformedRecords) naming the line number.
std::vector<ScanRecord> parse_scanprint(std::string_view stream);

nlohmann::json to_json(const ScanRecord& r);
nlohmann::json to_json(const Submission& s);
nlohmann::json to_json(const CheckpointState& c);
nlohmann::json to_json(const IndexerStats& st);
nlohmann::json to_json(const FailureInfo& f);

} // namespace sai

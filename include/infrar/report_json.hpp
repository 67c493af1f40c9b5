// report_json.hpp - JSON serialization of transform results and batch reports
#pragma once
#include "infrar/driver.hpp"
#include <string>
#include <vector>

namespace infrar {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// One object per skipped site: file, line, column, code, reason, hint, notes.
std::string skipped_to_json(const std::vector<Diagnostic>& skipped, const std::string& file);

// Serialize one file's result to a compact JSON object.
std::string result_to_json(const TransformResult& r, const std::string& file);

// Serialize a batch: {"provider":..,"files":[..],"skipped":[..]} where "skipped" flattens every file's skips.
std::string report_to_json(const std::vector<FileReport>& reports, Provider provider);

} // namespace infrar

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "diagnostics/diagnostic_record.hpp"

namespace cuebridge::report {

// {"file": ..., "line": 7, "column": 1, "message": ...}
nlohmann::json record_to_json(const diagnostics::DiagnosticRecord& record);

// JSON array of records, in the order given.
std::string render_json(const std::vector<diagnostics::DiagnosticRecord>& records);

// One "file:line:column: message" line per record.
std::string render_text(const std::vector<diagnostics::DiagnosticRecord>& records);

}  // namespace cuebridge::report

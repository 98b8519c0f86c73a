#include "report/diagnostics_report.hpp"

#include <sstream>

namespace cuebridge::report {

using nlohmann::json;

json record_to_json(const diagnostics::DiagnosticRecord& record) {
    json payload;
    payload["file"] = record.file.string();
    payload["line"] = record.line;
    payload["column"] = record.column;
    payload["message"] = record.message;
    return payload;
}

std::string render_json(const std::vector<diagnostics::DiagnosticRecord>& records) {
    json payload = json::array();
    for (const auto& record : records) {
        payload.push_back(record_to_json(record));
    }
    return payload.dump(2);
}

std::string render_text(const std::vector<diagnostics::DiagnosticRecord>& records) {
    std::ostringstream out;
    for (const auto& record : records) {
        out << record.file.string() << ":" << record.line << ":" << record.column
            << ": " << record.message << "\n";
    }
    return out.str();
}

}  // namespace cuebridge::report

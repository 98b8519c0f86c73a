#pragma once

#include <filesystem>
#include <string>

namespace cuebridge::diagnostics {

// One reported problem. line and column are 1-based and always positive.
// file is the file handed to the check, never a path echoed by the tool.
struct DiagnosticRecord {
    std::filesystem::path file;
    int line = 1;
    int column = 1;
    std::string message;
};

inline bool operator==(const DiagnosticRecord& lhs, const DiagnosticRecord& rhs) {
    return lhs.file == rhs.file && lhs.line == rhs.line && lhs.column == rhs.column &&
           lhs.message == rhs.message;
}

inline bool operator!=(const DiagnosticRecord& lhs, const DiagnosticRecord& rhs) {
    return !(lhs == rhs);
}

}  // namespace cuebridge::diagnostics

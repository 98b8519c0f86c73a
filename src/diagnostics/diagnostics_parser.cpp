#include "diagnostics/diagnostics_parser.hpp"

#include <utility>

namespace cuebridge::diagnostics {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (end < text.size() && !line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }

    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

DiagnosticsParser::DiagnosticsParser()
    : DiagnosticsParser(std::make_shared<CuePositionMatcher>()) {}

DiagnosticsParser::DiagnosticsParser(std::shared_ptr<const PositionMatcher> matcher,
                                     std::string group_indent)
    : matcher_(std::move(matcher)), group_indent_(std::move(group_indent)) {}

std::vector<std::vector<std::string>> DiagnosticsParser::group(
    const std::string& raw_output) const {
    const std::string& indent = group_indent_;
    return group_by_ordered(split_lines(raw_output), [&indent](const std::string& line) {
        return line.rfind(indent, 0) != 0;
    });
}

std::vector<DiagnosticRecord> DiagnosticsParser::parse(
    const std::string& raw_output, const std::filesystem::path& file) const {
    std::vector<DiagnosticRecord> records;
    for (const auto& error_group : group(raw_output)) {
        const std::string& message = error_group.front();
        for (std::size_t i = 1; i < error_group.size(); ++i) {
            const auto position = matcher_->match(error_group[i]);
            if (!position.has_value()) {
                continue;
            }
            records.push_back(
                DiagnosticRecord{file, position->line, position->column, message});
        }
    }
    return records;
}

}  // namespace cuebridge::diagnostics

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "diagnostics/diagnostic_record.hpp"
#include "diagnostics/position_matcher.hpp"

namespace cuebridge::diagnostics {

// cue indents position lines; anything without this prefix is a new header.
inline constexpr const char* kGroupIndent = "   ";

// Splits on LF and CRLF. Trailing empty lines are dropped.
std::vector<std::string> split_lines(const std::string& text);

/**
 * input: [A, B, C, A, A, D]
 * starts_group: x -> x == A
 * output: [[A, B, C], [A], [A, D]]
 *
 * The first element always opens a group, whatever the predicate says.
 */
template <typename T, typename Predicate>
std::vector<std::vector<T>> group_by_ordered(const std::vector<T>& items,
                                             Predicate starts_group) {
    std::vector<std::vector<T>> groups;
    for (const auto& item : items) {
        if (groups.empty() || starts_group(item)) {
            groups.emplace_back();
        }
        groups.back().push_back(item);
    }
    return groups;
}

// Rebuilds grouped error blocks from vet output:
//
//   missing ',' in list literal:
//       ./LintingErrors.cue:9:3
//
// Every position line under a header yields one record carrying the header
// as its message. Lines the matcher rejects are skipped.
class DiagnosticsParser {
public:
    DiagnosticsParser();
    explicit DiagnosticsParser(std::shared_ptr<const PositionMatcher> matcher,
                               std::string group_indent = kGroupIndent);

    std::vector<std::vector<std::string>> group(const std::string& raw_output) const;

    std::vector<DiagnosticRecord> parse(const std::string& raw_output,
                                        const std::filesystem::path& file) const;

private:
    std::shared_ptr<const PositionMatcher> matcher_;
    std::string group_indent_;
};

}  // namespace cuebridge::diagnostics

#include "diagnostics/position_matcher.hpp"

#include <charconv>
#include <system_error>

namespace cuebridge::diagnostics {

namespace {

constexpr const char* kPositionIndent = "    ";
constexpr std::size_t kPositionIndentLength = 4;

bool all_digits(const std::string& text, const std::size_t begin, const std::size_t end) {
    if (begin >= end) {
        return false;
    }
    for (std::size_t i = begin; i < end; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    return true;
}

std::optional<int> parse_positive(const char* begin, const char* end) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parse_positive(const std::string& digits) {
    return parse_positive(digits.data(), digits.data() + digits.size());
}

}  // namespace

std::optional<SourcePosition> CuePositionMatcher::match(const std::string& line) const {
    if (line.compare(0, kPositionIndentLength, kPositionIndent) != 0) {
        return std::nullopt;
    }

    // "    <path>:<line>:<column>"; the path may itself contain colons.
    const std::size_t column_colon = line.rfind(':');
    if (column_colon == std::string::npos || column_colon <= kPositionIndentLength ||
        !all_digits(line, column_colon + 1, line.size())) {
        return std::nullopt;
    }
    const std::size_t line_colon = line.rfind(':', column_colon - 1);
    if (line_colon == std::string::npos || line_colon < kPositionIndentLength ||
        !all_digits(line, line_colon + 1, column_colon)) {
        return std::nullopt;
    }

    const char* data = line.data();
    const auto line_number = parse_positive(data + line_colon + 1, data + column_colon);
    const auto column_number = parse_positive(data + column_colon + 1, data + line.size());
    if (!line_number.has_value() || !column_number.has_value()) {
        return std::nullopt;
    }
    return SourcePosition{line_number.value(), column_number.value()};
}

RegexPositionMatcher::RegexPositionMatcher(const std::string& pattern)
    : pattern_(pattern, std::regex::ECMAScript | std::regex::optimize) {}

core::errors::Result<std::shared_ptr<const PositionMatcher>> RegexPositionMatcher::create(
    const std::string& pattern) {
    try {
        return std::shared_ptr<const PositionMatcher>(
            std::make_shared<RegexPositionMatcher>(pattern));
    } catch (const std::regex_error& e) {
        return core::errors::BridgeError{core::errors::ErrorCategory::Input,
                                         "Invalid position pattern: " + pattern,
                                         "invalid_position_pattern", "", e.what()};
    }
}

std::optional<SourcePosition> RegexPositionMatcher::match(
    const std::string& line) const {
    if (line.size() > kMaxLineLength) {
        return std::nullopt;
    }
    std::smatch groups;
    if (!std::regex_match(line, groups, pattern_) || groups.size() < 3) {
        return std::nullopt;
    }

    const auto line_number = parse_positive(groups[1].str());
    const auto column_number = parse_positive(groups[2].str());
    if (!line_number.has_value() || !column_number.has_value()) {
        return std::nullopt;
    }
    return SourcePosition{line_number.value(), column_number.value()};
}

}  // namespace cuebridge::diagnostics

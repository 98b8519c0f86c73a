#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace cuebridge::diagnostics {

struct SourcePosition {
    int line = 1;
    int column = 1;
};

// Recognizes the position lines below a message header. Implementations
// must reject positions that are not strictly positive.
class PositionMatcher {
public:
    virtual ~PositionMatcher() = default;
    virtual std::optional<SourcePosition> match(const std::string& line) const = 0;
};

// cue's format: four spaces, a path, ":<line>:<column>" at the end of the
// line. Scans from both ends, so cost is linear in the line and independent
// of how long the path is.
class CuePositionMatcher : public PositionMatcher {
public:
    std::optional<SourcePosition> match(const std::string& line) const override;
};

// Matches a caller-supplied pattern. std::regex recurses per character, so
// lines longer than kMaxLineLength are rejected without being matched.
class RegexPositionMatcher : public PositionMatcher {
public:
    static constexpr std::size_t kMaxLineLength = 4096;

    // pattern must capture the line in group 1 and the column in group 2.
    // Throws std::regex_error on a malformed pattern; create() reports it instead.
    explicit RegexPositionMatcher(const std::string& pattern);

    static core::errors::Result<std::shared_ptr<const PositionMatcher>> create(
        const std::string& pattern);

    std::optional<SourcePosition> match(const std::string& line) const override;

private:
    std::regex pattern_;
};

}  // namespace cuebridge::diagnostics

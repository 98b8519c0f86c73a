#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace cuebridge::process {

// Locates the external tool. Nothing is cached: every call looks again.
class ExecutableResolver {
public:
    // search_path overrides the PATH environment variable (colon separated).
    explicit ExecutableResolver(std::optional<std::string> search_path = std::nullopt);

    // A non-empty configured path must be an executable regular file.
    // Otherwise tool_name is looked up in the search path.
    core::errors::Result<std::filesystem::path> resolve(
        const std::optional<std::string>& configured_path,
        const std::string& tool_name) const;

    core::errors::Result<std::filesystem::path> find_in_search_path(
        const std::string& tool_name) const;

    static bool is_executable_file(const std::filesystem::path& path);

private:
    std::string current_search_path() const;

    std::optional<std::string> search_path_;
};

}  // namespace cuebridge::process

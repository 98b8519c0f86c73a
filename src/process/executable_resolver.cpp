#include "process/executable_resolver.hpp"

#include <cstdlib>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace cuebridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

ExecutableResolver::ExecutableResolver(std::optional<std::string> search_path)
    : search_path_(std::move(search_path)) {}

bool ExecutableResolver::is_executable_file(const std::filesystem::path& path) {
    struct stat info {};
    if (stat(path.c_str(), &info) != 0) {
        return false;
    }
    if (!S_ISREG(info.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::string ExecutableResolver::current_search_path() const {
    if (search_path_.has_value()) {
        return search_path_.value();
    }
    const char* env_path = std::getenv("PATH");
    return env_path == nullptr ? std::string() : std::string(env_path);
}

core::errors::Result<std::filesystem::path> ExecutableResolver::find_in_search_path(
    const std::string& tool_name) const {
    const std::string search_path = current_search_path();

    std::size_t start = 0;
    while (start <= search_path.size()) {
        std::size_t end = search_path.find(':', start);
        if (end == std::string::npos) {
            end = search_path.size();
        }
        const std::string dir = search_path.substr(start, end - start);
        start = end + 1;

        // Empty entries would mean "current directory"; never run tools from there.
        if (dir.empty()) {
            continue;
        }

        const std::filesystem::path candidate = std::filesystem::path(dir) / tool_name;
        if (is_executable_file(candidate)) {
            std::error_code ec;
            const auto absolute = std::filesystem::absolute(candidate, ec);
            return ec ? candidate : absolute;
        }
    }

    return BridgeError{ErrorCategory::Resolution,
                       "Executable '" + tool_name + "' not found in PATH.",
                       core::errors::kExecutableNotFound,
                       "Install " + tool_name +
                           " or configure the path to the executable."};
}

core::errors::Result<std::filesystem::path> ExecutableResolver::resolve(
    const std::optional<std::string>& configured_path,
    const std::string& tool_name) const {
    if (!configured_path.has_value() || configured_path->empty()) {
        CUEBRIDGE_LOG_DEBUG("ExecutableResolver: searching PATH for " + tool_name);
        return find_in_search_path(tool_name);
    }

    const std::filesystem::path path(configured_path.value());
    if (!is_executable_file(path)) {
        return BridgeError{ErrorCategory::Resolution,
                           "Configured executable is not an executable file: " +
                               path.string(),
                           core::errors::kUserPathNotFound,
                           "Check the configured executable path."};
    }

    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path : absolute;
}

}  // namespace cuebridge::process

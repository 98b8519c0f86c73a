#pragma once
#include <string>
#include <variant>

namespace cuebridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,       // E.g., bad CLI flag or malformed config file
        Resolution,  // E.g., the cue executable could not be located
        Execution,   // E.g., spawn failure or broken stdin pipe
        Internal     // E.g., C++ logic bug
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";   // Helpful tips for the user
            std::string cause = "";  // Lower-level reason (strerror text, parser message)
        };

    // Stable codes shared by the runner, the service and the message catalog
    inline constexpr const char* kExecutableNotFound = "executable_not_found";
    inline constexpr const char* kUserPathNotFound = "user_path_not_found";
    inline constexpr const char* kExecuteError = "execute_error";

    // 2. Propagation strategy (Result Object)
    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    // ExecutableNotFound and ExecuteError both count as "the tool is unusable"
    inline bool is_tool_unavailable(const BridgeError& error) {
        return error.code == kExecutableNotFound || error.code == kUserPathNotFound ||
               error.code == kExecuteError;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Resolution: return "resolution";
            case ErrorCategory::Execution:  return "execution";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace cuebridge::core::errors

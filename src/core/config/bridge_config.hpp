#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"

namespace cuebridge::core::config {

// What `check` does with the output of a vet run that exited non-zero.
enum class CheckExitPolicy {
    Parse,    // cue prints its diagnostics and exits 1 when issues are found
    Discard   // only trust output from a zero exit
};

struct BridgeConfig {
    // Absolute path to the cue binary; empty means "search PATH".
    std::string executable_path;
    std::string tool_name = "cue";
    std::chrono::milliseconds timeout{5000};
    CheckExitPolicy check_exit_policy = CheckExitPolicy::Parse;
    std::optional<std::filesystem::path> message_bundle;
    logging::LogLevel log_level = logging::LogLevel::WARN;
};

// Reads a JSON settings file. Missing keys keep their defaults.
//
// {
//   "executable_path": "/usr/local/bin/cue",
//   "timeout_ms": 5000,
//   "check_exit_policy": "parse" | "discard",
//   "message_bundle": "messages.de.json",
//   "log_level": "debug" | "info" | "warn" | "error"
// }
errors::Result<BridgeConfig> load_config(const std::filesystem::path& path);

errors::Result<BridgeConfig> parse_config(const std::string& json_text);

errors::Result<CheckExitPolicy> parse_check_exit_policy(const std::string& value);
errors::Result<logging::LogLevel> parse_log_level(const std::string& value);

std::string to_string(CheckExitPolicy policy);

}  // namespace cuebridge::core::config

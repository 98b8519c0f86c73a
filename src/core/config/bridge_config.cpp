#include "core/config/bridge_config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace cuebridge::core::config {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError invalid_field(const std::string& key, const std::string& expected) {
    return BridgeError{ErrorCategory::Input,
                       "Config field '" + key + "' must be " + expected + ".",
                       "invalid_config_field"};
}

}  // namespace

errors::Result<CheckExitPolicy> parse_check_exit_policy(const std::string& value) {
    if (value == "parse") {
        return CheckExitPolicy::Parse;
    }
    if (value == "discard") {
        return CheckExitPolicy::Discard;
    }
    return BridgeError{ErrorCategory::Input,
                       "Unknown check exit policy: " + value,
                       "invalid_check_exit_policy",
                       "Use \"parse\" or \"discard\"."};
}

errors::Result<logging::LogLevel> parse_log_level(const std::string& value) {
    if (value == "debug") {
        return logging::LogLevel::DEBUG;
    }
    if (value == "info") {
        return logging::LogLevel::INFO;
    }
    if (value == "warn") {
        return logging::LogLevel::WARN;
    }
    if (value == "error") {
        return logging::LogLevel::ERROR;
    }
    return BridgeError{ErrorCategory::Input, "Unknown log level: " + value,
                       "invalid_log_level",
                       "Use one of debug, info, warn, error."};
}

std::string to_string(const CheckExitPolicy policy) {
    switch (policy) {
        case CheckExitPolicy::Parse:
            return "parse";
        case CheckExitPolicy::Discard:
            return "discard";
        default:
            return "unknown";
    }
}

errors::Result<BridgeConfig> parse_config(const std::string& json_text) {
    const json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        return BridgeError{ErrorCategory::Input, "Config file is not valid JSON.",
                           "invalid_config_json"};
    }
    if (!root.is_object()) {
        return BridgeError{ErrorCategory::Input,
                           "Config file must contain a JSON object.",
                           "invalid_config_json"};
    }

    BridgeConfig config;

    if (const auto it = root.find("executable_path"); it != root.end()) {
        if (!it->is_string()) {
            return invalid_field("executable_path", "a string");
        }
        config.executable_path = it->get<std::string>();
    }

    if (const auto it = root.find("tool_name"); it != root.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            return invalid_field("tool_name", "a non-empty string");
        }
        config.tool_name = it->get<std::string>();
    }

    if (const auto it = root.find("timeout_ms"); it != root.end()) {
        if (!it->is_number_unsigned() || it->get<std::uint64_t>() == 0) {
            return invalid_field("timeout_ms", "a positive integer");
        }
        config.timeout = std::chrono::milliseconds(it->get<std::uint64_t>());
    }

    if (const auto it = root.find("check_exit_policy"); it != root.end()) {
        if (!it->is_string()) {
            return invalid_field("check_exit_policy", "a string");
        }
        auto policy = parse_check_exit_policy(it->get<std::string>());
        if (errors::is_error(policy)) {
            return errors::get_error(policy);
        }
        config.check_exit_policy = errors::get_value(policy);
    }

    if (const auto it = root.find("message_bundle"); it != root.end()) {
        if (!it->is_string()) {
            return invalid_field("message_bundle", "a string");
        }
        config.message_bundle = std::filesystem::path(it->get<std::string>());
    }

    if (const auto it = root.find("log_level"); it != root.end()) {
        if (!it->is_string()) {
            return invalid_field("log_level", "a string");
        }
        auto level = parse_log_level(it->get<std::string>());
        if (errors::is_error(level)) {
            return errors::get_error(level);
        }
        config.log_level = errors::get_value(level);
    }

    return config;
}

errors::Result<BridgeConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Unable to open config file: " + path.string(),
                           "config_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_config(buffer.str());
    if (errors::is_error(parsed)) {
        auto error = errors::get_error(parsed);
        error.message = path.string() + ": " + error.message;
        return error;
    }

    // A relative bundle path is relative to the config file, not the cwd.
    auto config = errors::get_value(parsed);
    if (config.message_bundle.has_value() && config.message_bundle->is_relative()) {
        config.message_bundle = path.parent_path() / config.message_bundle.value();
    }
    return config;
}

}  // namespace cuebridge::core::config

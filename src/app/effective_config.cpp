#include "app/effective_config.hpp"

#include <chrono>

namespace cuebridge::app {

using core::config::BridgeConfig;
using core::errors::Result;

Result<BridgeConfig> build_effective_config(const protocol::BridgeRequest& request) {
    BridgeConfig config;
    if (request.config_file.has_value()) {
        auto loaded = core::config::load_config(request.config_file.value());
        if (core::errors::is_error(loaded)) {
            return core::errors::get_error(loaded);
        }
        config = core::errors::get_value(loaded);
    }

    if (request.executable_path.has_value()) {
        config.executable_path = request.executable_path.value();
    }
    if (request.timeout_ms.has_value()) {
        config.timeout = std::chrono::milliseconds(request.timeout_ms.value());
    }
    if (request.check_exit_policy.has_value()) {
        auto policy =
            core::config::parse_check_exit_policy(request.check_exit_policy.value());
        if (core::errors::is_error(policy)) {
            return core::errors::get_error(policy);
        }
        config.check_exit_policy = core::errors::get_value(policy);
    }
    if (request.verbose) {
        config.log_level = core::logging::LogLevel::DEBUG;
    }
    return config;
}

}  // namespace cuebridge::app

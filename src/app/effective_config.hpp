#pragma once
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/bridge_request.hpp"

namespace cuebridge::app {

    // Config file values (or defaults when no --config was given), with the
    // command line flags layered on top.
    cuebridge::core::errors::Result<cuebridge::core::config::BridgeConfig> build_effective_config(
        const cuebridge::protocol::BridgeRequest& request);

} // namespace cuebridge::app

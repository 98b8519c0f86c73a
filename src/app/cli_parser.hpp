#pragma once
#include "protocol/bridge_request.hpp"
#include "core/errors/bridge_errors.hpp"

namespace cuebridge::app::cli {
    cuebridge::core::errors::Result<cuebridge::protocol::BridgeRequest> parse_and_validate(int argc, char* argv[]);
}

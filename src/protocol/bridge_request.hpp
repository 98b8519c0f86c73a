#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace cuebridge::protocol {

    enum class BridgeCommand {
        Format,  // cue fmt -
        Check    // cue vet <file>
    };

    enum class ReportFormat {
        Text,
        Json
    };

    // Validated command line input. Unset optionals fall back to the config file.
    struct BridgeRequest {
        BridgeCommand command = BridgeCommand::Check;
        // fmt reads stdin when no file is given; vet requires one.
        std::optional<std::filesystem::path> file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> executable_path;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<std::string> check_exit_policy;
        ReportFormat report_format = ReportFormat::Text;
        bool verbose = false;
    };

    inline std::string to_string(const BridgeCommand command) {
        switch (command) {
            case BridgeCommand::Format:
                return "fmt";
            case BridgeCommand::Check:
                return "vet";
            default:
                return "unknown";
        }
    }

} // namespace cuebridge::protocol

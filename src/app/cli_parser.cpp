#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>
#include "core/config/bridge_config.hpp"

namespace cuebridge::app::cli {

    using namespace cuebridge::core::errors;
    using cuebridge::protocol::BridgeCommand;
    using cuebridge::protocol::BridgeRequest;
    using cuebridge::protocol::ReportFormat;

    namespace {

    constexpr const char* kUsage =
        "Usage: cue_bridge fmt [FILE] | cue_bridge vet FILE "
        "[--config PATH] [--cue PATH] [--timeout-ms N] "
        "[--check-exit-policy parse|discard] [--json] [--verbose]";

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> file;
        std::optional<std::string> config;
        std::optional<std::string> cue;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> check_exit_policy;
        bool json = false;
        bool verbose = false;
    };

    BridgeError missing_value(const std::string& flag) {
        return BridgeError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
    }

    } // namespace

    Result<BridgeRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        BridgeRequest req;
        std::string command = argv[1];
        if (command == "fmt") {
            req.command = BridgeCommand::Format;
        } else if (command == "vet") {
            req.command = BridgeCommand::Check;
        } else {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return missing_value("--config");
            } else if (args[i] == "--cue") {
                if (i + 1 < args.size()) raw.cue = args[++i];
                else return missing_value("--cue");
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return missing_value("--timeout-ms");
            } else if (args[i] == "--check-exit-policy") {
                if (i + 1 < args.size()) raw.check_exit_policy = args[++i];
                else return missing_value("--check-exit-policy");
            } else if (args[i] == "--json") {
                raw.json = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i].rfind("--", 0) == 0) {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else if (raw.file.has_value()) {
                return BridgeError{ErrorCategory::Input, "Only one file may be given.", "unexpected_argument"};
            } else {
                raw.file = args[i];
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;
        req.report_format = raw.json ? ReportFormat::Json : ReportFormat::Text;

        if (req.command == BridgeCommand::Check && !raw.file.has_value()) {
            return BridgeError{ErrorCategory::Input, "vet requires a file to check.", "missing_file", kUsage};
        }
        if (req.command == BridgeCommand::Format && raw.json) {
            return BridgeError{ErrorCategory::Input, "--json only applies to vet.", "conflicting_flags"};
        }

        if (raw.file) {
            std::filesystem::path p(raw.file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return BridgeError{ErrorCategory::Input, "File does not exist or is not a regular file: " + p.string(), "invalid_path"};
            }
            req.file = std::move(p);
        }

        if (raw.config) {
            req.config_file = std::filesystem::path(raw.config.value());
        }
        if (raw.cue) {
            req.executable_path = raw.cue.value();
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 600000) {
                return BridgeError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 600000."};
            }
            req.timeout_ms = timeout;
        }

        if (raw.check_exit_policy) {
            auto policy = cuebridge::core::config::parse_check_exit_policy(raw.check_exit_policy.value());
            if (is_error(policy)) {
                return get_error(policy);
            }
            req.check_exit_policy = raw.check_exit_policy.value();
        }

        return req;
    }

} // namespace cuebridge::app::cli

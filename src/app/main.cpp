#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/effective_config.hpp"
#include "core/config/bridge_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "core/messages/message_catalog.hpp"
#include "report/diagnostics_report.hpp"
#include "service/cue_command_service.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFindings = 1;
constexpr int kExitInputError = 2;
constexpr int kExitToolError = 3;

std::atomic_bool* g_interrupt_flag = nullptr;

void handle_interrupt(int) {
    if (g_interrupt_flag != nullptr) {
        g_interrupt_flag->store(true);
    }
}

void report_tool_error(const cuebridge::core::messages::MessageCatalog& catalog,
                       const cuebridge::core::errors::BridgeError& err) {
    CUEBRIDGE_LOG_ERROR(catalog.describe(err) + " [" +
                        cuebridge::core::errors::to_string(err.category) + "/" + err.code + "]");
    if (!err.cause.empty()) {
        CUEBRIDGE_LOG_ERROR("Cause: " + err.cause);
    }
    CUEBRIDGE_LOG_DEBUG("Detail: " + err.message);
    if (!err.hint.empty()) {
        CUEBRIDGE_LOG_INFO("Hint: " + err.hint);
    }
    if (cuebridge::core::errors::is_tool_unavailable(err)) {
        CUEBRIDGE_LOG_INFO("Point --cue or \"executable_path\" at a working cue binary.");
    }
}

bool read_input(const cuebridge::protocol::BridgeRequest& req, std::string& content) {
    if (!req.file.has_value()) {
        content.assign(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }
    std::ifstream in(req.file.value(), std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace cuebridge;

    // 1. Tag every log line of this invocation
    core::logging::Logger::get().set_session_tag(core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        CUEBRIDGE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            CUEBRIDGE_LOG_ERROR("Hint: " + err.hint);
        }
        return kExitInputError;
    }
    const auto& req = core::errors::get_value(parsed);

    // 3. Layer config file and flags
    auto effective = app::build_effective_config(req);
    if (core::errors::is_error(effective)) {
        const auto& err = core::errors::get_error(effective);
        CUEBRIDGE_LOG_ERROR("Config error [" + err.code + "]: " + err.message);
        return kExitInputError;
    }
    const auto& config = core::errors::get_value(effective);
    core::logging::Logger::get().set_min_level(config.log_level);

    core::messages::MessageCatalog catalog;
    if (config.message_bundle.has_value()) {
        auto loaded = catalog.load_bundle(config.message_bundle.value());
        if (core::errors::is_error(loaded)) {
            CUEBRIDGE_LOG_WARN(core::errors::get_error(loaded).message +
                               "; using built-in messages");
        }
    }

    // 4. Ctrl-C cancels the running cue process instead of orphaning it
    auto cancel_token = std::make_shared<std::atomic_bool>(false);
    g_interrupt_flag = cancel_token.get();
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    const service::DefaultCueCommandService cue(config);
    CUEBRIDGE_LOG_INFO("Running cue " + protocol::to_string(req.command) +
                       " (timeout " + std::to_string(config.timeout.count()) +
                       " ms, check exit policy " +
                       core::config::to_string(config.check_exit_policy) + ")");

    if (req.command == protocol::BridgeCommand::Format) {
        std::string content;
        if (!read_input(req, content)) {
            CUEBRIDGE_LOG_ERROR("Unable to read input to format.");
            return kExitInputError;
        }

        auto formatted = cue.format(content, cancel_token);
        if (core::errors::is_error(formatted)) {
            report_tool_error(catalog, core::errors::get_error(formatted));
            return kExitToolError;
        }
        const auto& text = core::errors::get_value(formatted);
        if (!text.has_value()) {
            CUEBRIDGE_LOG_WARN("cue fmt produced no result (invalid input, failure or timeout).");
            return kExitFindings;
        }
        std::cout << text.value();
        return kExitOk;
    }

    auto checked = cue.check(req.file.value(), cancel_token);
    if (core::errors::is_error(checked)) {
        report_tool_error(catalog, core::errors::get_error(checked));
        return kExitToolError;
    }
    const auto& records = core::errors::get_value(checked);
    if (req.report_format == protocol::ReportFormat::Json) {
        std::cout << report::render_json(records) << std::endl;
    } else {
        std::cout << report::render_text(records);
    }
    return records.empty() ? kExitOk : kExitFindings;
}

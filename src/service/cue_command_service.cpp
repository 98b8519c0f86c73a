#include "service/cue_command_service.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace cuebridge::service {

using core::config::BridgeConfig;
using core::config::CheckExitPolicy;
using diagnostics::DiagnosticRecord;
using process::ExecutionResult;
using process::ToolInvocation;

DefaultCueCommandService::DefaultCueCommandService(
    BridgeConfig config, process::ExecutableResolver resolver,
    process::ProcessRunner runner, diagnostics::DiagnosticsParser parser)
    : config_(std::move(config)),
      resolver_(std::move(resolver)),
      runner_(runner),
      parser_(std::move(parser)) {}

std::unique_ptr<CueCommandService> DefaultCueCommandService::with_timeout(
    const std::chrono::milliseconds timeout) const {
    BridgeConfig config = config_;
    config.timeout = timeout;
    return std::make_unique<DefaultCueCommandService>(std::move(config), resolver_,
                                                      runner_, parser_);
}

core::errors::Result<ExecutionResult> DefaultCueCommandService::run_cue(
    std::optional<std::string> stdin_text, std::vector<std::string> arguments,
    const process::CancelToken& cancel_token) const {
    auto executable = resolver_.resolve(config_.executable_path, config_.tool_name);
    if (core::errors::is_error(executable)) {
        return core::errors::get_error(executable);
    }

    ToolInvocation invocation;
    invocation.executable = core::errors::get_value(executable);
    invocation.arguments = std::move(arguments);
    invocation.stdin_text = std::move(stdin_text);
    invocation.timeout = config_.timeout;
    return runner_.execute(invocation, cancel_token);
}

core::errors::Result<std::optional<std::string>> DefaultCueCommandService::format(
    const std::string& content, const process::CancelToken& cancel_token) const {
    auto executed = run_cue(content, {"fmt", "-"}, cancel_token);
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }

    const auto& output = core::errors::get_value(executed);
    if (!output.succeeded()) {
        CUEBRIDGE_LOG_DEBUG("CueCommandService: fmt unusable, state=" +
                            process::to_string(output.state));
        return std::optional<std::string>();
    }
    return std::optional<std::string>(output.stdout_text);
}

core::errors::Result<std::vector<DiagnosticRecord>> DefaultCueCommandService::check(
    const std::filesystem::path& file, const process::CancelToken& cancel_token) const {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(file, ec);
    if (ec) {
        absolute = file;
    }

    auto executed = run_cue(std::nullopt, {"vet", absolute.string()}, cancel_token);
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }

    const auto& output = core::errors::get_value(executed);
    if (output.timed_out() || output.cancelled() || !output.exit_code_set()) {
        return std::vector<DiagnosticRecord>();
    }
    if (!output.stderr_text.empty()) {
        CUEBRIDGE_LOG_DEBUG("CueCommandService: vet stderr: " + output.stderr_text);
    }
    if (output.exit_code.value() != 0 &&
        config_.check_exit_policy == CheckExitPolicy::Discard) {
        CUEBRIDGE_LOG_DEBUG("CueCommandService: discarding vet output, exit=" +
                            std::to_string(output.exit_code.value()));
        return std::vector<DiagnosticRecord>();
    }

    auto records = parser_.parse(output.stdout_text, file);
    CUEBRIDGE_LOG_DEBUG("CueCommandService: vet reported " +
                        std::to_string(records.size()) + " problem(s) in " +
                        file.string());
    return records;
}

}  // namespace cuebridge::service

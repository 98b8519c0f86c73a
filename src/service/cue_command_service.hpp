#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "diagnostics/diagnostic_record.hpp"
#include "diagnostics/diagnostics_parser.hpp"
#include "process/executable_resolver.hpp"
#include "process/process_runner.hpp"

namespace cuebridge::service {

// Interaction with the cue command line tool.
class CueCommandService {
public:
    virtual ~CueCommandService() = default;

    // Calls "cue fmt -" with content on stdin. Returns stdout when cue exits
    // with 0, nothing when it fails, times out or is cancelled. Errors are
    // reserved for a missing executable or a failed launch.
    virtual core::errors::Result<std::optional<std::string>> format(
        const std::string& content,
        const process::CancelToken& cancel_token = nullptr) const = 0;

    // Calls "cue vet <absolute path>" and parses the reported problems.
    virtual core::errors::Result<std::vector<diagnostics::DiagnosticRecord>> check(
        const std::filesystem::path& file,
        const process::CancelToken& cancel_token = nullptr) const = 0;

    virtual std::unique_ptr<CueCommandService> with_timeout(
        std::chrono::milliseconds timeout) const = 0;
};

class DefaultCueCommandService : public CueCommandService {
public:
    explicit DefaultCueCommandService(
        core::config::BridgeConfig config,
        process::ExecutableResolver resolver = process::ExecutableResolver(),
        process::ProcessRunner runner = process::ProcessRunner(),
        diagnostics::DiagnosticsParser parser = diagnostics::DiagnosticsParser());

    core::errors::Result<std::optional<std::string>> format(
        const std::string& content,
        const process::CancelToken& cancel_token = nullptr) const override;

    core::errors::Result<std::vector<diagnostics::DiagnosticRecord>> check(
        const std::filesystem::path& file,
        const process::CancelToken& cancel_token = nullptr) const override;

    std::unique_ptr<CueCommandService> with_timeout(
        std::chrono::milliseconds timeout) const override;

    const core::config::BridgeConfig& config() const { return config_; }

private:
    core::errors::Result<process::ExecutionResult> run_cue(
        std::optional<std::string> stdin_text, std::vector<std::string> arguments,
        const process::CancelToken& cancel_token) const;

    const core::config::BridgeConfig config_;
    const process::ExecutableResolver resolver_;
    const process::ProcessRunner runner_;
    const diagnostics::DiagnosticsParser parser_;
};

}  // namespace cuebridge::service

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace cuebridge::process {

// Lifecycle of one child process. Every path out of Running kills the
// child if it is still alive and reaps it.
enum class ProcessState {
    Spawned,
    Running,
    Completed,
    TimedOut,
    Cancelled
};

struct ToolInvocation {
    std::filesystem::path executable;
    std::vector<std::string> arguments;
    // Written in full, then the child's stdin is closed. Without a payload the
    // child reads from /dev/null.
    std::optional<std::string> stdin_text;
    std::chrono::milliseconds timeout{5000};
};

struct ExecutionResult {
    ProcessState state = ProcessState::Spawned;
    // Only set for Completed; a signal death is reported as 128 + signal.
    std::optional<int> exit_code;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool timed_out() const { return state == ProcessState::TimedOut; }
    bool cancelled() const { return state == ProcessState::Cancelled; }
    bool exit_code_set() const { return exit_code.has_value(); }
    bool succeeded() const {
        return state == ProcessState::Completed && exit_code.has_value() &&
               exit_code.value() == 0;
    }
};

using CancelToken = std::shared_ptr<std::atomic_bool>;

class ProcessRunner {
public:
    // Spawns exactly one process and blocks until it exits, the timeout
    // elapses or cancel_token is raised. Spawn and pipe failures come back as
    // execute_error; timeouts and cancellation are result states.
    // SIGPIPE is masked on the calling thread only while stdin is written;
    // the process-wide signal disposition is never changed.
    core::errors::Result<ExecutionResult> execute(
        const ToolInvocation& invocation,
        const CancelToken& cancel_token = nullptr) const;

    std::future<core::errors::Result<ExecutionResult>> execute_async(
        ToolInvocation invocation, CancelToken cancel_token = nullptr) const;
};

std::string to_string(ProcessState state);

}  // namespace cuebridge::process

#include "process/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <fcntl.h>
#include <ctime>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

extern char** environ;

namespace cuebridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr int kPollIntervalMs = 50;
// After a kill, how long to keep draining pipes that something outside the
// process group may still hold open.
constexpr std::chrono::milliseconds kKillGracePeriod{250};

class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
        fd_ = fd;
    }

private:
    int fd_;
};

int open_pipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return errno;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return 0;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(ScopedFd& fd, std::string& out) {
    if (!fd.is_open()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
        return;
    }
}

// Blocks SIGPIPE on the calling thread only, so a child that closes its
// stdin early yields EPIPE instead of killing the host process. The process
// wide disposition is left alone.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        was_pending_ = sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        blocked_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &previous_) == 0;
    }

    ~ScopedSigpipeBlock() {
        if (blocked_) {
            static_cast<void>(pthread_sigmask(SIG_SETMASK, &previous_, nullptr));
        }
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

    // Consumes the SIGPIPE our own write raised so it is not delivered once
    // the mask is restored.
    void discard_raised() const {
        if (!blocked_ || was_pending_) {
            return;
        }
        const timespec no_wait{0, 0};
        while (sigtimedwait(&sigpipe_, nullptr, &no_wait) == -1 && errno == EINTR) {
        }
    }

private:
    sigset_t sigpipe_{};
    sigset_t previous_{};
    bool was_pending_ = false;
    bool blocked_ = false;
};

// Pushes as much of the payload as the pipe takes. The write end is closed
// once everything is written and on every failure. Returns 0 or an errno.
int write_pending(ScopedFd& fd, const std::string& payload, std::size_t& written) {
    const ScopedSigpipeBlock sigpipe_block;
    while (fd.is_open() && written < payload.size()) {
        const ssize_t n =
            write(fd.get(), payload.data() + written, payload.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return 0;
        }
        const int err = n < 0 ? errno : EIO;
        if (err == EPIPE) {
            sigpipe_block.discard_raised();
        }
        fd.reset();
        return err;
    }
    fd.reset();
    return 0;
}

bool mentions_utf8(const std::string& locale) {
    std::string lowered;
    for (const char c : locale) {
        if (c != '-') {
            lowered.push_back(static_cast<char>(
                c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c));
        }
    }
    return lowered.find("utf8") != std::string::npos;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

// The parent environment, with a UTF-8 character locale forced in when the
// inherited one is not UTF-8. Built before fork: the child may only make
// async-signal-safe calls.
std::vector<std::string> build_child_environment() {
    std::vector<std::string> env;
    std::string effective_locale;
    std::string lc_all;
    std::string lc_ctype;
    std::string lang;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string value(*entry);
        if (starts_with(value, "LC_ALL=")) {
            lc_all = value.substr(7);
        } else if (starts_with(value, "LC_CTYPE=")) {
            lc_ctype = value.substr(9);
        } else if (starts_with(value, "LANG=")) {
            lang = value.substr(5);
        }
        env.push_back(std::move(value));
    }

    if (!lc_all.empty()) {
        effective_locale = lc_all;
    } else if (!lc_ctype.empty()) {
        effective_locale = lc_ctype;
    } else {
        effective_locale = lang;
    }
    if (mentions_utf8(effective_locale)) {
        return env;
    }

    std::vector<std::string> forced;
    forced.reserve(env.size() + 1);
    for (auto& value : env) {
        if (starts_with(value, "LC_ALL=") || starts_with(value, "LC_CTYPE=")) {
            continue;
        }
        forced.push_back(std::move(value));
    }
    forced.emplace_back("LC_CTYPE=C.UTF-8");
    return forced;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& value : strings) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

// Child side only.
bool redirect(const int from, const int to) {
    if (from == to) {
        const int flags = fcntl(from, F_GETFD);
        return flags != -1 && fcntl(from, F_SETFD, flags & ~FD_CLOEXEC) != -1;
    }
    return dup2(from, to) != -1;
}

[[noreturn]] void report_exec_failure(const int fd, const int err) {
    const ssize_t ignored = write(fd, &err, sizeof(err));
    static_cast<void>(ignored);
    _exit(127);
}

void kill_process_group(const pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

pid_t wait_blocking(const pid_t pid, int& status) {
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    return waited;
}

BridgeError make_execute_error(const std::string& message, const int err) {
    return BridgeError{ErrorCategory::Execution, message,
                       core::errors::kExecuteError, "",
                       std::error_code(err, std::generic_category()).message()};
}

}  // namespace

std::string to_string(const ProcessState state) {
    switch (state) {
        case ProcessState::Spawned:
            return "spawned";
        case ProcessState::Running:
            return "running";
        case ProcessState::Completed:
            return "completed";
        case ProcessState::TimedOut:
            return "timed_out";
        case ProcessState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<ExecutionResult> ProcessRunner::execute(
    const ToolInvocation& invocation, const CancelToken& cancel_token) const {
    ExecutionResult result;
    if (cancel_token && cancel_token->load()) {
        result.state = ProcessState::Cancelled;
        CUEBRIDGE_LOG_DEBUG("ProcessRunner: cancelled before start: " +
                            invocation.executable.string());
        return result;
    }

    ScopedFd stdin_read;
    ScopedFd stdin_write;
    ScopedFd stdout_read;
    ScopedFd stdout_write;
    ScopedFd stderr_read;
    ScopedFd stderr_write;
    ScopedFd exec_error_read;
    ScopedFd exec_error_write;

    int err = 0;
    if (invocation.stdin_text.has_value()) {
        err = open_pipe(stdin_read, stdin_write);
    } else {
        stdin_read.reset(open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!stdin_read.is_open()) {
            err = errno;
        }
    }
    if (err == 0) {
        err = open_pipe(stdout_read, stdout_write);
    }
    if (err == 0) {
        err = open_pipe(stderr_read, stderr_write);
    }
    if (err == 0) {
        err = open_pipe(exec_error_read, exec_error_write);
    }
    if (err != 0) {
        return make_execute_error("Failed to create process pipes.", err);
    }

    std::vector<std::string> argv_strings;
    argv_strings.reserve(invocation.arguments.size() + 1);
    argv_strings.push_back(invocation.executable.string());
    argv_strings.insert(argv_strings.end(), invocation.arguments.begin(),
                        invocation.arguments.end());
    std::vector<char*> argv = to_c_array(argv_strings);
    std::vector<std::string> env_strings = build_child_environment();
    std::vector<char*> envp = to_c_array(env_strings);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        return make_execute_error("Failed to fork process.", errno);
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        static_cast<void>(sigaction(SIGPIPE, &default_action, nullptr));
        if (!redirect(stdin_read.get(), STDIN_FILENO) ||
            !redirect(stdout_write.get(), STDOUT_FILENO) ||
            !redirect(stderr_write.get(), STDERR_FILENO)) {
            report_exec_failure(exec_error_write.get(), errno);
        }
        execve(argv[0], argv.data(), envp.data());
        report_exec_failure(exec_error_write.get(), errno);
    }

    // Both sides call setpgid so the group exists before any kill below.
    static_cast<void>(setpgid(pid, pid));
    result.state = ProcessState::Spawned;

    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    exec_error_write.reset();

    // The error pipe is close-on-exec: EOF means execve succeeded.
    int exec_errno = 0;
    ssize_t exec_report = -1;
    do {
        exec_report = read(exec_error_read.get(), &exec_errno, sizeof(exec_errno));
    } while (exec_report < 0 && errno == EINTR);
    exec_error_read.reset();

    int status = 0;
    if (exec_report == static_cast<ssize_t>(sizeof(exec_errno))) {
        static_cast<void>(wait_blocking(pid, status));
        return make_execute_error(
            "Failed to start " + invocation.executable.string(), exec_errno);
    }

    result.state = ProcessState::Running;
    CUEBRIDGE_LOG_DEBUG("ProcessRunner: started pid " + std::to_string(pid) +
                        ": " + invocation.executable.string());

    set_nonblocking(stdout_read.get());
    set_nonblocking(stderr_read.get());

    std::size_t written = 0;
    if (stdin_write.is_open()) {
        set_nonblocking(stdin_write.get());
        if (invocation.stdin_text->empty()) {
            stdin_write.reset();
        }
    }

    bool child_exited = false;
    bool status_known = false;
    int write_errno = 0;
    std::optional<std::chrono::steady_clock::time_point> killed_at;

    while (stdout_read.is_open() || stderr_read.is_open() || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (!killed_at.has_value()) {
            if (cancel_token && cancel_token->load()) {
                result.state = ProcessState::Cancelled;
                kill_process_group(pid);
                killed_at = now;
            } else if (now - started >= invocation.timeout) {
                result.state = ProcessState::TimedOut;
                kill_process_group(pid);
                killed_at = now;
            }
        } else if (child_exited && now - killed_at.value() >= kKillGracePeriod) {
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_read.is_open()) {
            fds[nfds].fd = stdout_read.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_read.is_open()) {
            fds[nfds].fd = stderr_read.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stdin_write.is_open()) {
            fds[nfds].fd = stdin_write.get();
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, kPollIntervalMs));

        if (stdin_write.is_open()) {
            const int write_result =
                write_pending(stdin_write, invocation.stdin_text.value(), written);
            if (write_result == EPIPE) {
                CUEBRIDGE_LOG_DEBUG("ProcessRunner: child closed stdin after " +
                                    std::to_string(written) + " bytes");
            } else if (write_result != 0 && !killed_at.has_value()) {
                write_errno = write_result;
                kill_process_group(pid);
                killed_at = now;
            }
        }

        drain_pipe(stdout_read, result.stdout_text);
        drain_pipe(stderr_read, result.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                status_known = true;
            } else if (waited < 0 && errno == ECHILD) {
                // Reaped elsewhere (SIGCHLD ignored); the exit status is lost.
                child_exited = true;
            }
        }

        if (child_exited && !stdout_read.is_open() && !stderr_read.is_open()) {
            break;
        }
    }

    if (!child_exited) {
        kill_process_group(pid);
        status_known = wait_blocking(pid, status) == pid;
    }

    const auto ended = std::chrono::steady_clock::now();
    result.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();

    if (write_errno != 0) {
        return make_execute_error("Failed to write to process stdin.", write_errno);
    }

    if (result.state == ProcessState::Running) {
        result.state = ProcessState::Completed;
        if (status_known && WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (status_known && WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    } else {
        CUEBRIDGE_LOG_WARN("ProcessRunner: " + invocation.executable.string() +
                           " " + to_string(result.state) + " after " +
                           std::to_string(static_cast<long>(result.duration_ms)) +
                           " ms");
    }

    CUEBRIDGE_LOG_DEBUG(
        "ProcessRunner: pid " + std::to_string(pid) + " finished: " +
        to_string(result.state) +
        (result.exit_code.has_value()
             ? " exit=" + std::to_string(result.exit_code.value())
             : std::string()));
    return result;
}

std::future<core::errors::Result<ExecutionResult>> ProcessRunner::execute_async(
    ToolInvocation invocation, CancelToken cancel_token) const {
    const ProcessRunner runner = *this;
    return std::async(std::launch::async,
                      [runner, invocation = std::move(invocation),
                       cancel_token = std::move(cancel_token)]() {
                          return runner.execute(invocation, cancel_token);
                      });
}

}  // namespace cuebridge::process

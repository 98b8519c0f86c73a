#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "process/process_runner.hpp"
#include "test_support.hpp"

namespace {

using cuebridge::core::errors::ErrorCategory;
using cuebridge::core::errors::get_error;
using cuebridge::core::errors::get_value;
using cuebridge::core::errors::is_error;
using cuebridge::process::ExecutionResult;
using cuebridge::process::ProcessRunner;
using cuebridge::process::ProcessState;
using cuebridge::process::ToolInvocation;
using cuebridge::testing::TempWorkspace;
using cuebridge::testing::process_alive;
using cuebridge::testing::read_pid;
using cuebridge::testing::write_file;
using cuebridge::testing::write_script;

ToolInvocation shell(const std::string& script, std::chrono::milliseconds timeout =
                                                    std::chrono::milliseconds(5000)) {
    ToolInvocation invocation;
    invocation.executable = "/bin/sh";
    invocation.arguments = {"-c", script};
    invocation.timeout = timeout;
    return invocation;
}

// Polls until the pid file has content; the child writes it asynchronously.
int wait_for_pid(const std::filesystem::path& pid_file) {
    for (int i = 0; i < 200; ++i) {
        const int pid = read_pid(pid_file);
        if (pid > 0) {
            return pid;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return -1;
}

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    ProcessRunner runner;
    auto result = runner.execute(shell("printf 'out'; printf 'err' >&2; exit 3"));
    ASSERT_FALSE(is_error(result));

    const auto& output = get_value(result);
    EXPECT_EQ(output.state, ProcessState::Completed);
    ASSERT_TRUE(output.exit_code_set());
    EXPECT_EQ(output.exit_code.value(), 3);
    EXPECT_EQ(output.stdout_text, "out");
    EXPECT_EQ(output.stderr_text, "err");
    EXPECT_FALSE(output.succeeded());
}

TEST(ProcessRunnerTest, PassesArgumentsVerbatim) {
    ProcessRunner runner;
    ToolInvocation invocation = shell("printf '%s|' \"$@\"");
    invocation.arguments.push_back("sh");
    invocation.arguments.push_back("two words");
    invocation.arguments.push_back("$HOME");

    auto result = runner.execute(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "two words|$HOME|");
    EXPECT_TRUE(get_value(result).succeeded());
}

TEST(ProcessRunnerTest, WritesStdinAndClosesIt) {
    ProcessRunner runner;
    ToolInvocation invocation = shell("cat");
    invocation.stdin_text = "a: 1\nb: \"ü\"\n";

    auto result = runner.execute(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    EXPECT_EQ(get_value(result).stdout_text, "a: 1\nb: \"ü\"\n");
}

TEST(ProcessRunnerTest, StreamsLargeStdinWithoutDeadlock) {
    ProcessRunner runner;
    ToolInvocation invocation = shell("cat");
    invocation.stdin_text = std::string(1 << 20, 'x');

    auto result = runner.execute(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    EXPECT_EQ(get_value(result).stdout_text.size(), static_cast<std::size_t>(1 << 20));
}

TEST(ProcessRunnerTest, ToleratesChildThatIgnoresStdin) {
    ProcessRunner runner;
    ToolInvocation invocation = shell("exec 0<&-; printf done");
    invocation.stdin_text = std::string(1 << 20, 'x');

    auto result = runner.execute(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).succeeded());
    EXPECT_EQ(get_value(result).stdout_text, "done");
}

TEST(ProcessRunnerTest, LeavesHostSigpipeHandlingUntouched) {
    struct sigaction before {};
    ASSERT_EQ(sigaction(SIGPIPE, nullptr, &before), 0);

    ProcessRunner runner;
    ToolInvocation invocation = shell("exec 0<&-; printf done");
    invocation.stdin_text = std::string(1 << 20, 'x');
    auto result = runner.execute(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "done");

    struct sigaction after {};
    ASSERT_EQ(sigaction(SIGPIPE, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);

    sigset_t mask;
    sigemptyset(&mask);
    ASSERT_EQ(pthread_sigmask(SIG_SETMASK, nullptr, &mask), 0);
    EXPECT_EQ(sigismember(&mask, SIGPIPE), 0);

    sigset_t pending;
    sigemptyset(&pending);
    ASSERT_EQ(sigpending(&pending), 0);
    EXPECT_EQ(sigismember(&pending, SIGPIPE), 0);
}

TEST(ProcessRunnerTest, NoStdinPayloadReadsEmptyInput) {
    ProcessRunner runner;
    auto result = runner.execute(shell("wc -c"));
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).stdout_text.find('0'), std::string::npos);
}

TEST(ProcessRunnerTest, TimesOutAndKillsChild) {
    TempWorkspace workspace;
    const auto pid_file = workspace.root() / "pid";

    ProcessRunner runner;
    const auto started = std::chrono::steady_clock::now();
    auto result = runner.execute(shell("echo $$ > '" + pid_file.string() + "'; exec sleep 30",
                                       std::chrono::milliseconds(200)));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    const auto& output = get_value(result);
    EXPECT_EQ(output.state, ProcessState::TimedOut);
    EXPECT_TRUE(output.timed_out());
    EXPECT_FALSE(output.exit_code_set());
    EXPECT_FALSE(output.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(3));

    const int pid = wait_for_pid(pid_file);
    ASSERT_GT(pid, 0);
    EXPECT_FALSE(process_alive(pid));
}

TEST(ProcessRunnerTest, TimeoutAlsoKillsGrandchildren) {
    TempWorkspace workspace;
    const auto pid_file = workspace.root() / "pid";

    ProcessRunner runner;
    auto result = runner.execute(
        shell("sleep 30 & echo $! > '" + pid_file.string() + "'; wait",
              std::chrono::milliseconds(200)));
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out());

    const int pid = wait_for_pid(pid_file);
    ASSERT_GT(pid, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(process_alive(pid));
}

TEST(ProcessRunnerTest, CancelledTokenBeforeStartSpawnsNothing) {
    TempWorkspace workspace;
    const auto marker = workspace.root() / "ran";

    ProcessRunner runner;
    auto token = std::make_shared<std::atomic_bool>(true);
    auto result = runner.execute(shell("touch '" + marker.string() + "'"), token);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled());
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST(ProcessRunnerTest, CancellationDuringRunKillsChild) {
    TempWorkspace workspace;
    const auto pid_file = workspace.root() / "pid";

    ProcessRunner runner;
    auto token = std::make_shared<std::atomic_bool>(false);
    auto pending = runner.execute_async(
        shell("echo $$ > '" + pid_file.string() + "'; exec sleep 30"), token);

    const int pid = wait_for_pid(pid_file);
    ASSERT_GT(pid, 0);
    token->store(true);

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto result = pending.get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).state, ProcessState::Cancelled);
    EXPECT_FALSE(get_value(result).exit_code_set());
    EXPECT_FALSE(process_alive(pid));
}

TEST(ProcessRunnerTest, ReportsSignalDeathAsExitCode) {
    ProcessRunner runner;
    auto result = runner.execute(shell("kill -9 $$"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).state, ProcessState::Completed);
    ASSERT_TRUE(get_value(result).exit_code_set());
    EXPECT_EQ(get_value(result).exit_code.value(), 128 + 9);
}

TEST(ProcessRunnerTest, LaunchFailureIsExecuteError) {
    TempWorkspace workspace;
    const auto broken = workspace.root() / "broken";
    write_file(broken, "#!/nonexistent/interpreter\n");
    std::filesystem::permissions(broken, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);

    ToolInvocation invocation;
    invocation.executable = broken;

    ProcessRunner runner;
    auto result = runner.execute(invocation);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "execute_error");
    EXPECT_FALSE(get_error(result).cause.empty());
}

TEST(ProcessRunnerTest, ForcesUtf8CharacterLocale) {
    ProcessRunner runner;
    auto result = runner.execute(shell("locale_ok=no; "
                                       "for v in \"$LC_ALL\" \"$LC_CTYPE\" \"$LANG\"; do "
                                       "  if [ -n \"$v\" ]; then "
                                       "    case \"$v\" in *[Uu][Tt][Ff]*8*) locale_ok=yes;; esac; "
                                       "    break; "
                                       "  fi; "
                                       "done; printf %s \"$locale_ok\""));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "yes");
}

TEST(ProcessRunnerTest, ConcurrentInvocationsStayIndependent) {
    ProcessRunner runner;
    std::vector<std::future<cuebridge::core::errors::Result<ExecutionResult>>> pending;
    for (int i = 0; i < 8; ++i) {
        ToolInvocation invocation = shell("cat");
        invocation.stdin_text = "job-" + std::to_string(i);
        pending.push_back(runner.execute_async(invocation));
    }

    for (int i = 0; i < 8; ++i) {
        auto result = pending[static_cast<std::size_t>(i)].get();
        ASSERT_FALSE(is_error(result));
        EXPECT_TRUE(get_value(result).succeeded());
        EXPECT_EQ(get_value(result).stdout_text, "job-" + std::to_string(i));
    }
}

TEST(ProcessRunnerTest, ScriptExecutableRunsDirectly) {
    TempWorkspace workspace;
    const auto tool = write_script(workspace.root() / "tool", "printf '%s' \"$1\"\n");

    ToolInvocation invocation;
    invocation.executable = tool;
    invocation.arguments = {"fmt"};

    ProcessRunner runner;
    auto result = runner.execute(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "fmt");
}

}  // namespace

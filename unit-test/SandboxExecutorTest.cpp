#include <errno.h>
#include <signal.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>
#include "gtest/gtest.h"
#include "ojudge/config.hpp"
#include "ojudge/sandbox/executor.hpp"
#include "ojudge/sandbox/program.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace ojudge;

namespace {

/**
 * 总是设置失败的 limiter，用于检查 exec 之前的错误处理
 */
struct failing_limiter : public resource_limiter {
    string name() const override { return "failing"; }
    bool enforces_cpu_limit() const override { return false; }
    int apply(const resource_limits &) const noexcept override { return EPERM; }
};

}  // namespace

class SandboxExecutorTest : public ::testing::Test {
protected:
    sandbox_executor executor;

    execution_result run_sh(const string &script, const string &input = "", resource_limits limits = {5, 256}) {
        source_program prog(get_language("sh"), script);
        return executor.run(prog, input, limits);
    }
};

TEST_F(SandboxExecutorTest, ExecutedCapturesStdout) {
    auto result = run_sh("echo hello\necho world\n");
    EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
    EXPECT_EQ(result.output, "hello\nworld\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_FALSE(result.signal);
    EXPECT_GE(result.wall_time, 0);
    EXPECT_GE(result.cpu_time, 0);
    EXPECT_GT(result.memory, 0);
}

TEST_F(SandboxExecutorTest, InputIsFedToStdin) {
    auto result = run_sh("read a\nread b\necho $((a + b))\n", "1\n2\n");
    EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
    EXPECT_EQ(result.output, "3\n");
}

TEST_F(SandboxExecutorTest, LargeOutputDoesNotDeadlock) {
    auto result = run_sh("cat\n", string(1 << 20, 'x'));
    EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
    EXPECT_EQ(result.output.size(), 1u << 20);
}

TEST_F(SandboxExecutorTest, UnreadInputIsNotAnError) {
    auto result = run_sh("exit 0\n", string(1 << 20, 'x'));
    EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
}

TEST_F(SandboxExecutorTest, SleepExceedsWallTime) {
    auto result = run_sh("sleep 10\necho done\n", "", {1, 256});
    EXPECT_EQ(result.status, execution_status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.output, "");
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(SandboxExecutorTest, SleepAfterClosingStdoutExceedsWallTime) {
    auto result = run_sh("exec >&- 2>&-\nsleep 10\n", "", {1, 256});
    EXPECT_EQ(result.status, execution_status::TIME_LIMIT_EXCEEDED);
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(SandboxExecutorTest, BusyLoopExceedsTimeLimit) {
    auto result = run_sh("while :; do :; done\n", "", {1, 256});
    EXPECT_EQ(result.status, execution_status::TIME_LIMIT_EXCEEDED);
}

TEST_F(SandboxExecutorTest, StderrWithZeroExitIsRuntimeError) {
    auto result = run_sh("echo 42\necho warning >&2\nexit 0\n");
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.output, "42\n");
    EXPECT_EQ(result.error, "warning\n");
}

TEST_F(SandboxExecutorTest, NonZeroExitIsRuntimeError) {
    auto result = run_sh("exit 3\n");
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    EXPECT_EQ(result.exitcode, 3);
}

TEST_F(SandboxExecutorTest, SignalIsRuntimeError) {
    auto result = run_sh("kill -SEGV $$\n");
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exitcode, 128 + SIGSEGV);
}

TEST_F(SandboxExecutorTest, MemoryLimitIsRuntimeError) {
    auto result = run_sh("x=$(head -c 200000000 /dev/zero | tr '\\0' a)\necho ${#x}\n", "", {10, 64});
    EXPECT_EQ(result.status, execution_status::RUNTIME_ERROR);
}

TEST_F(SandboxExecutorTest, NonPositiveLimitsAreDisabled) {
    auto result = run_sh("echo ok\n", "", {0, 0});
    EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
    EXPECT_EQ(result.output, "ok\n");
}

TEST_F(SandboxExecutorTest, HugeLimitsDoNotOverflow) {
    for (resource_limits limits : {resource_limits{1e10, 0}, resource_limits{5e6, INT64_C(1) << 50}, resource_limits{1e300, INT64_MAX}}) {
        auto result = run_sh("echo ok\n", "", limits);
        EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
        EXPECT_EQ(result.output, "ok\n");
        EXPECT_LT(result.wall_time, 5);
    }
}

static bool process_gone(pid_t pid) {
    if (kill(pid, 0) != 0) return errno == ESRCH;
    // 已被杀死但尚未被 init 回收
    ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    string content((istreambuf_iterator<char>(stat)), istreambuf_iterator<char>());
    auto pos = content.rfind(')');
    return pos != string::npos && pos + 2 < content.size() && content[pos + 2] == 'Z';
}

TEST_F(SandboxExecutorTest, BackgroundProcessIsKilledAfterExit) {
    auto result = run_sh("sleep 30 >/dev/null 2>&1 &\necho $!\nexit 0\n");
    ASSERT_EQ(result.status, execution_status::EXECUTED) << result.message;
    EXPECT_LT(result.wall_time, 5);

    pid_t pid = stoi(result.output);
    bool gone = false;
    for (int i = 0; i < 200 && !gone; ++i) {
        gone = process_gone(pid);
        if (!gone) this_thread::sleep_for(chrono::milliseconds(10));
    }
    EXPECT_TRUE(gone) << "process " << pid << " survived";
}

TEST_F(SandboxExecutorTest, ConcurrentRunsDoNotInterfere) {
    const int THREADS = 8, ROUNDS = 5;
    vector<string> failures[THREADS];
    vector<thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([this, t, &failures] {
            for (int r = 0; r < ROUNDS; ++r) {
                auto expected = std::to_string(t * ROUNDS + r);
                auto result = run_sh("sleep 0.05 >/dev/null &\nread x\necho $x\n", expected + "\n");
                if (result.status != execution_status::EXECUTED || result.output != expected + "\n")
                    failures[t].push_back(expected + ": " + result.message + " " + result.output);
            }
        });
    }
    for (auto &worker : workers) worker.join();
    for (int t = 0; t < THREADS; ++t)
        EXPECT_TRUE(failures[t].empty()) << failures[t].front();
}

TEST_F(SandboxExecutorTest, MissingSolutionIsJudgeError) {
    executable_program prog("/nonexistent/ojudge/solution");
    auto result = executor.run(prog, "", {1, 64});
    EXPECT_EQ(result.status, execution_status::JUDGE_ERROR);
    EXPECT_EQ(result.message, "Solution file '/nonexistent/ojudge/solution' not found.");
    EXPECT_FALSE(result.exitcode);
}

TEST_F(SandboxExecutorTest, ExecFailureIsJudgeError) {
    test::temp_directory dir;
    auto file = dir.write("not-executable", "echo hi\n");
    std::filesystem::permissions(file, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

    executable_program prog(file);
    auto result = executor.run(prog, "", {1, 64});
    EXPECT_EQ(result.status, execution_status::JUDGE_ERROR);
    EXPECT_NE(result.message.find("unable to start command"), string::npos) << result.message;
}

TEST_F(SandboxExecutorTest, LimiterFailureIsJudgeError) {
    sandbox_executor failing(make_unique<failing_limiter>());
    source_program prog(get_language("sh"), "echo hi\n");
    auto result = failing.run(prog, "", {1, 64});
    EXPECT_EQ(result.status, execution_status::JUDGE_ERROR);
    EXPECT_NE(result.message.find("unable to set resource limits"), string::npos) << result.message;
}

TEST_F(SandboxExecutorTest, ExecutableWithArguments) {
    executable_program prog("/bin/sh", {"-c", "echo $0", "arg"});
    auto result = executor.run(prog, "", {1, 64});
    EXPECT_EQ(result.status, execution_status::EXECUTED) << result.message;
    EXPECT_EQ(result.output, "arg\n");
}

TEST_F(SandboxExecutorTest, TimeoutOnlyLimiterStillKillsOnWallTime) {
    sandbox_executor timeout_only(make_unique<timeout_only_limiter>());
    EXPECT_FALSE(timeout_only.get_limiter().enforces_cpu_limit());

    source_program prog(get_language("sh"), "while :; do :; done\n");
    auto result = timeout_only.run(prog, "", {1, 64});
    EXPECT_EQ(result.status, execution_status::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(result.signal);
}

TEST_F(SandboxExecutorTest, DefaultLimiterEnforcesCpuLimit) {
    EXPECT_EQ(executor.get_limiter().name(), "posix");
    EXPECT_TRUE(executor.get_limiter().enforces_cpu_limit());
}

TEST(ProgramTest, SourceProgramIsRemovedAfterUse) {
    std::filesystem::path workdir;
    {
        source_program prog(get_language("python"), "print(1)\n");
        workdir = prog.get_work_dir();
        EXPECT_TRUE(std::filesystem::exists(prog.get_run_path()));
        EXPECT_EQ(prog.get_run_path().extension().string(), ".py");
        EXPECT_EQ(prog.get_run_command().front(), PYTHON_INTERPRETER);
        EXPECT_EQ(prog.get_run_command().back(), prog.get_run_path().string());
    }
    EXPECT_FALSE(std::filesystem::exists(workdir));
}

TEST(ProgramTest, LanguageLookup) {
    EXPECT_EQ(get_language("python").extension, ".py");
    EXPECT_EQ(get_language("sh").extension, ".sh");
    EXPECT_THROW(get_language("cobol"), invalid_argument);
    ASSERT_NE(find_language_by_extension(".sh"), nullptr);
    EXPECT_EQ(find_language_by_extension(".sh")->name, "sh");
    EXPECT_EQ(find_language_by_extension(".exe"), nullptr);
}

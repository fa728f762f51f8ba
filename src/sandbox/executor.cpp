#include "ojudge/sandbox/executor.hpp"
#include <errno.h>
#include <limits.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include "ojudge/common/defer.hpp"

namespace ojudge {
using namespace std;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

const size_t BUF_SIZE = 4096;

const struct timespec waitdelay = {0, 10000000L};  // 0.01s

/**
 * @brief 子进程在 exec 之前失败时，通过管道告知父进程失败的阶段和 errno
 */
struct child_failure {
    enum stage_t : int {
        REDIRECT = 1,
        LIMIT = 2,
        EXEC = 3
    } stage;
    int err;
};

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "fcntl, setting O_NONBLOCK");
}

/**
 * @brief 选手程序可能不读完输入就退出，此时写入 stdin 会收到 SIGPIPE，
 * 评测进程必须忽略该信号，改为处理 EPIPE。
 */
static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] static void child_fail(int report_fd, child_failure::stage_t stage, int err) {
    child_failure failure{stage, err};
    // 写失败时父进程只能看到管道关闭，此时退出码 127 会被判为运行时错误
    if (write(report_fd, &failure, sizeof(failure)) != sizeof(failure)) _exit(126);
    _exit(127);
}

/**
 * @brief fork 后在子进程中执行，只调用异步信号安全的函数
 */
[[noreturn]] static void run_child(char **argv, const resource_limiter &limiter, const resource_limits &limits,
                                   int stdin_fd, int stdout_fd, int stderr_fd, int report_fd) {
    // 选手程序及其子进程位于独立的进程组，超时时可以一起杀死
    setpgid(0, 0);

    // 管道都带有 O_CLOEXEC，exec 后除了标准输入输出以外的描述符都会被关闭
    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0)
        child_fail(report_fd, child_failure::REDIRECT, errno);

    // 被忽略的信号在 exec 之后仍然被忽略，因此要恢复 SIGPIPE
    struct sigaction sigact;
    sigact.sa_handler = SIG_DFL;
    sigact.sa_flags = 0;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGPIPE, &sigact, nullptr);

    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    if (int err = limiter.apply(limits); err != 0)
        child_fail(report_fd, child_failure::LIMIT, err);

    execvp(argv[0], argv);
    child_fail(report_fd, child_failure::EXEC, errno);
}

static void pump_input(int &fd, const string &input, size_t &written) {
    ssize_t nwritten = write(fd, input.data() + written, input.size() - written);
    if (nwritten < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        // 选手程序关闭了 stdin 或者已经退出，剩余的输入直接丢弃
        if (errno == EPIPE) {
            close_fd(fd);
            return;
        }
        error(errno, "writing input to child");
    }
    written += nwritten;
    if (written == input.size()) close_fd(fd);
}

static void pump_output(int &fd, string &buffer) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        error(errno, "reading output of child");
    }
    if (nread == 0) {
        // EOF，关闭管道并用 -1 标记
        close_fd(fd);
        return;
    }
    buffer.append(buf, nread);
}

static double to_seconds(const struct timeval &tv) {
    return tv.tv_sec + tv.tv_usec * 1e-6;
}

sandbox_executor::sandbox_executor()
    : sandbox_executor(make_resource_limiter()) {}

sandbox_executor::sandbox_executor(unique_ptr<resource_limiter> limiter)
    : limiter(move(limiter)) {
    if (!this->limiter)
        throw invalid_argument("resource limiter must not be null");
    ignore_sigpipe();
}

const resource_limiter &sandbox_executor::get_limiter() const {
    return *limiter;
}

execution_result sandbox_executor::run(const program &prog, const string &input, const resource_limits &limits) {
    execution_result result;
    try {
        auto path = prog.get_run_path();
        if (!filesystem::exists(path)) {
            result.status = execution_status::JUDGE_ERROR;
            result.message = fmt::format("Solution file '{}' not found.", path.string());
            return result;
        }

        auto command = prog.get_run_command();
        if (command.empty())
            throw invalid_argument("empty command line");
        return spawn(command, input, limits);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unexpected error when running " << prog.get_run_path() << ": " << ex.what();
        result = execution_result();
        result.status = execution_status::JUDGE_ERROR;
        result.message = fmt::format("An unexpected error occurred: {}", ex.what());
        return result;
    }
}

execution_result sandbox_executor::spawn(const vector<string> &command, const string &input, const resource_limits &limits) {
    execution_result result;

    // fork 之后子进程不能分配内存，因此提前准备好 argv
    vector<char *> argv;
    for (auto &arg : command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe, report_pipe}) {
            close_fd(fds[PIPE_READ]);
            close_fd(fds[PIPE_WRITE]);
        }
    };

    // O_CLOEXEC 避免并发评测时管道泄漏到其他选手程序中，导致 stdout 永远读不到 EOF
    for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe, report_pipe})
        if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe");

    auto starttime = chrono::steady_clock::now();
    pid_t child_pid = fork();
    if (child_pid < 0)
        error(errno, "unable to fork");
    if (child_pid == 0)
        run_child(argv.data(), *limiter, limits,
                  stdin_pipe[PIPE_READ], stdout_pipe[PIPE_WRITE], stderr_pipe[PIPE_WRITE], report_pipe[PIPE_WRITE]);

    bool reaped = false;
    defer {
        // 出现异常时也要保证选手程序被杀死并回收，不留下僵尸进程
        if (!reaped) {
            kill(-child_pid, SIGKILL);
            kill(child_pid, SIGKILL);
            while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR) {}
        }
    };

    // 父进程也设置一次进程组，避免子进程还没有调用 setpgid 时我们就需要杀死进程组
    setpgid(child_pid, child_pid);

    close_fd(stdin_pipe[PIPE_READ]);
    close_fd(stdout_pipe[PIPE_WRITE]);
    close_fd(stderr_pipe[PIPE_WRITE]);
    close_fd(report_pipe[PIPE_WRITE]);

    {
        // exec 成功后 report_pipe 被自动关闭，这里会读到 EOF
        child_failure failure;
        ssize_t nread;
        do {
            nread = read(report_pipe[PIPE_READ], &failure, sizeof(failure));
        } while (nread < 0 && errno == EINTR);
        if (nread < 0)
            error(errno, "reading child startup status");

        if (nread == sizeof(failure)) {
            while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR) {}
            reaped = true;

            result.status = execution_status::JUDGE_ERROR;
            switch (failure.stage) {
                case child_failure::EXEC:
                    result.message = fmt::format("unable to start command {}: {}", command[0], strerror(failure.err));
                    break;
                case child_failure::LIMIT:
                    result.message = fmt::format("unable to set resource limits with {}: {}", limiter->name(), strerror(failure.err));
                    break;
                default:
                    result.message = fmt::format("unable to redirect standard streams: {}", strerror(failure.err));
                    break;
            }
            LOG(ERROR) << result.message;
            return result;
        }
    }

    int &in_fd = stdin_pipe[PIPE_WRITE];
    int &out_fd = stdout_pipe[PIPE_READ];
    int &err_fd = stderr_pipe[PIPE_READ];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    size_t written = 0;
    if (input.empty()) close_fd(in_fd);

    bool use_wall_limit = limits.time_limit > 0;
    double wall_limit = min(limits.time_limit, MAX_TIME_LIMIT);
    auto deadline = starttime + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(wall_limit));
    bool timed_out = false;

    auto remaining_ms = [&]() -> int {
        if (!use_wall_limit) return -1;
        long long left = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
        return (int)min<long long>(max<long long>(left + 1, 0), INT_MAX);
    };

    while (in_fd >= 0 || out_fd >= 0 || err_fd >= 0) {
        if (use_wall_limit && chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int r = poll(fds, nfds, remaining_ms());
        if (r < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == in_fd)
                pump_input(in_fd, input, written);
            else if (fds[i].fd == out_fd)
                pump_output(out_fd, result.output);
            else if (fds[i].fd == err_fd)
                pump_output(err_fd, result.error);
        }
    }

    // WNOWAIT 让选手程序保持僵尸状态，在回收之前它的 pid 不会被复用，
    // 因此杀死进程组时不会误杀其他评测新创建的进程
    while (!timed_out) {
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, child_pid, &info, WEXITED | WNOWAIT | (use_wall_limit ? WNOHANG : 0)) != 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting on child");
        }
        if (info.si_pid == child_pid) break;

        // 选手程序关闭了标准输出但仍在运行
        if (use_wall_limit && chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        nanosleep(&waitdelay, nullptr);
    }

    if (timed_out) {
        LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);
        kill(child_pid, SIGKILL);
    } else {
        // 杀死进程组内残留的进程，确保选手程序 fork 出来的子进程不会留驻系统
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to clean up process group " << child_pid << ": " << strerror(errno);
    }

    int status = 0;
    struct rusage usage {};
    while (wait4(child_pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    reaped = true;

    auto endtime = chrono::steady_clock::now();
    result.wall_time = chrono::duration<double>(endtime - starttime).count();
    result.cpu_time = to_seconds(usage.ru_utime) + to_seconds(usage.ru_stime);
    result.memory = (int64_t)usage.ru_maxrss * 1024;  // Linux 下 ru_maxrss 单位为 KB

    VLOG(1) << fmt::format("run time: real {:.3f}, cpu {:.3f}, memory {}kB", result.wall_time, result.cpu_time, result.memory / 1024);

    if (timed_out) {
        result.status = execution_status::TIME_LIMIT_EXCEEDED;
        result.output.clear();
        result.message = fmt::format("wall time exceeded {:.3f} seconds", limits.time_limit);
        return result;
    }

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        result.signal = sig;
        result.exitcode = sig + 128;
        if (sig == SIGXCPU) {
            LOG(WARNING) << "Time Limit Exceeded (hard cpu limit)";
            result.status = execution_status::TIME_LIMIT_EXCEEDED;
            result.output.clear();
            result.message = fmt::format("cpu time exceeded {:.3f} seconds", limits.time_limit);
        } else {
            result.status = execution_status::RUNTIME_ERROR;
            result.message = fmt::format("Command terminated with signal ({}, {})", sig, strsignal(sig));
        }
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
        if (*result.exitcode != 0) {
            result.status = execution_status::RUNTIME_ERROR;
            result.message = fmt::format("Command exited with code {}", *result.exitcode);
        } else if (!result.error.empty()) {
            result.status = execution_status::RUNTIME_ERROR;
            result.message = "Command wrote to standard error";
        } else {
            result.status = execution_status::EXECUTED;
        }
        return result;
    }

    throw runtime_error(fmt::format("unknown status: {:x}", status));
}

}  // namespace ojudge

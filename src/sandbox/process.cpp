#include "sandbox/process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

const int BUF_SIZE = 4096;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

// 子进程退出后，等待残留输出的最长时间
const chrono::milliseconds drain_grace(100);

// 轮询子进程状态的最长间隔
const chrono::milliseconds poll_slice(50);

// 竞争的结果，先 claim 的事件决定执行结果
enum race_outcome : int {
    RUNNING = 0,
    COMPLETED = 1,
    TIMED_OUT = 2,
    MEMORY_EXCEEDED = 3
};

template <typename... Args>
static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "setting O_NONBLOCK on fd {}", fd);
}

static bool claim(atomic<int> &outcome, race_outcome event) {
    int expected = RUNNING;
    return outcome.compare_exchange_strong(expected, event);
}

/**
 * @brief 检查子进程是否已经结束，但不回收子进程
 * 子进程在被回收前 pid 不会被复用，因此内存监控线程和 kill(-pid) 不会误伤其他进程
 */
static bool has_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
        if (errno == EINTR) return false;
        error(errno, "waiting on child {}", pid);
    }
    return info.si_pid == pid;
}

/**
 * @brief 从管道读取当前可以读取的所有数据
 * @return 是否读到了 EOF
 */
static bool pump_pipe(int fd, string &buffer, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            size_t room = buffer.size() < limit ? limit - buffer.size() : 0;
            if ((size_t)nread > room) truncated = true;
            buffer.append(buf, min((size_t)nread, room));
        } else if (nread == 0) {
            return true;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return false;
        } else {
            error(errno, "reading from child fd {}", fd);
        }
    }
}

long sample_resident_memory(pid_t pid) {
    ifstream status("/proc/" + to_string(pid) + "/status");
    string line;
    while (getline(status, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            istringstream iss(line.substr(6));
            long kb = -1;
            iss >> kb;
            return kb;
        }
    }
    return -1;
}

posix_process_runner::posix_process_runner(chrono::milliseconds sample_interval, size_t output_limit)
    : sample_interval(sample_interval), output_limit(output_limit) {
    signal(SIGPIPE, SIG_IGN);
}

execution_result posix_process_runner::run(const process_request &request) {
    try {
        return run_impl(request);
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to run " << (request.command.empty() ? string("<empty>") : request.command[0]) << ": " << ex.what();
        return execution_result::failure(error_kind::PROCESS_SPAWN_ERROR, fmt::format("internal error: {}", ex.what()), ex.what());
    }
}

execution_result posix_process_runner::run_impl(const process_request &request) {
    if (request.command.empty())
        return execution_result::failure(error_kind::PROCESS_SPAWN_ERROR, "Execution error: empty command");

    // 子进程中只允许调用异步信号安全的函数，因此参数在 fork 之前准备好
    vector<char *> argv;
    for (auto &arg : request.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = request.working_directory.string();

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    defer {
        for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(p[PIPE_READ]);
            close_fd(p[PIPE_WRITE]);
        }
    };

    // exec_pipe 用于在 exec 失败时将 errno 传回父进程，exec 成功后写端随 O_CLOEXEC 关闭
    for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe})
        if (pipe2(p, O_CLOEXEC) != 0) error(errno, "creating pipe");

    VLOG(1) << "Spawning " << boost::algorithm::join(request.command, " ");

    elapsed_time timer;
    pid_t pid = fork();
    if (pid == -1) error(errno, "unable to fork");

    if (pid == 0) {  // 子进程
        // 独立的进程组，以便通过 kill(-pid) 杀死用户程序创建的所有子进程
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);

        int err = 0;
        if (dup2(stdin_pipe[PIPE_READ], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[PIPE_WRITE], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[PIPE_WRITE], STDERR_FILENO) < 0) {
            err = errno;
        } else if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            err = errno;
        } else {
            execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = write(exec_pipe[PIPE_WRITE], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // 父进程
    setpgid(pid, pid);  // 与子进程中的调用竞争，保证 kill(-pid) 时进程组已经存在
    bool reaped = false;
    defer {
        // 只有在内部错误导致提前退出时才会走到这里
        if (!reaped) {
            kill(-pid, SIGKILL);
            while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {}
        }
    };

    close_fd(stdin_pipe[PIPE_READ]);
    close_fd(stdout_pipe[PIPE_WRITE]);
    close_fd(stderr_pipe[PIPE_WRITE]);
    close_fd(exec_pipe[PIPE_WRITE]);

    {
        int child_errno = 0;
        ssize_t n;
        while ((n = read(exec_pipe[PIPE_READ], &child_errno, sizeof(child_errno))) == -1 && errno == EINTR) {}
        if (n == sizeof(child_errno)) {
            while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {}
            reaped = true;
            LOG(WARNING) << "Unable to start command " << request.command[0] << ": " << strerror(child_errno);
            return execution_result::failure(error_kind::PROCESS_SPAWN_ERROR,
                                             fmt::format("Execution error: unable to start {}: {}", request.command[0], strerror(child_errno)),
                                             strerror(child_errno));
        }
    }

    LOG(INFO) << "Started " << request.command[0] << " with pid " << pid
              << ", time limit " << request.timeout_seconds << "s, memory limit " << request.memory_limit_mb << "MB";

    atomic<int> outcome(RUNNING);
    atomic<long> peak_kb(0);
    long trigger_kb = 0;
    const long limit_kb = request.memory_limit_mb > 0 ? (long)request.memory_limit_mb * 1024 : 0;

    mutex watchdog_mutex;
    condition_variable watchdog_cv;
    bool watchdog_stop = false;

    thread watchdog([&] {
        unique_lock<mutex> lock(watchdog_mutex);
        while (!watchdog_stop) {
            lock.unlock();
            long rss = sample_resident_memory(pid);
            if (rss >= 0) {
                if (rss > peak_kb.load()) peak_kb.store(rss);
                VLOG(1) << "pid " << pid << " rss " << rss << "kB";
                if (limit_kb > 0 && rss > limit_kb) {
                    if (claim(outcome, MEMORY_EXCEEDED)) {
                        trigger_kb = rss;
                        LOG(WARNING) << "Memory limit exceeded by pid " << pid << " (" << rss << "kB > " << limit_kb << "kB), sending SIGKILL";
                        kill(-pid, SIGKILL);
                    }
                    return;
                }
            }
            lock.lock();
            watchdog_cv.wait_for(lock, sample_interval, [&] { return watchdog_stop; });
        }
    });
    auto stop_watchdog = [&] {
        {
            lock_guard<mutex> lock(watchdog_mutex);
            watchdog_stop = true;
        }
        watchdog_cv.notify_all();
        if (watchdog.joinable()) watchdog.join();
    };
    defer { stop_watchdog(); };

    int &stdin_fd = stdin_pipe[PIPE_WRITE];
    int &stdout_fd = stdout_pipe[PIPE_READ];
    int &stderr_fd = stderr_pipe[PIPE_READ];
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);
    if (request.stdin_data.empty())
        close_fd(stdin_fd);
    else
        set_nonblocking(stdin_fd);

    execution_result result;
    size_t stdin_offset = 0;
    const auto deadline = timer.started_at() + chrono::seconds(request.timeout_seconds);

    auto pump_outputs = [&](short stdout_events, short stderr_events) {
        if (stdout_fd >= 0 && (stdout_events & (POLLIN | POLLHUP | POLLERR)))
            if (pump_pipe(stdout_fd, result.stdout, output_limit, result.output_truncated)) close_fd(stdout_fd);
        if (stderr_fd >= 0 && (stderr_events & (POLLIN | POLLHUP | POLLERR)))
            if (pump_pipe(stderr_fd, result.stderr, output_limit, result.output_truncated)) close_fd(stderr_fd);
    };

    while (true) {
        if (has_exited(pid) || outcome.load() != RUNNING) break;

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            if (claim(outcome, TIMED_OUT)) {
                LOG(WARNING) << "Time limit exceeded by pid " << pid << " (" << request.timeout_seconds << "s), sending SIGKILL";
                kill(-pid, SIGKILL);
            }
            break;
        }
        int wait_ms = (int)min(chrono::duration_cast<chrono::milliseconds>(deadline - now), poll_slice).count();

        struct pollfd fds[3];
        int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1;
        if (stdin_fd >= 0) fds[in_idx = nfds++] = {stdin_fd, POLLOUT, 0};
        if (stdout_fd >= 0) fds[out_idx = nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[err_idx = nfds++] = {stderr_fd, POLLIN, 0};

        int r = poll(fds, nfds, max(wait_ms, 1));
        if (r == -1) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        if (r == 0) continue;

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                close_fd(stdin_fd);
            } else {
                size_t to_write = min((size_t)BUF_SIZE, request.stdin_data.size() - stdin_offset);
                ssize_t nwritten = write(stdin_fd, request.stdin_data.data() + stdin_offset, to_write);
                if (nwritten > 0) {
                    stdin_offset += nwritten;
                    if (stdin_offset == request.stdin_data.size()) close_fd(stdin_fd);
                } else if (nwritten == -1 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                    // 子进程提前关闭了 stdin (EPIPE)，剩余的输入直接丢弃
                    close_fd(stdin_fd);
                }
            }
        }
        pump_outputs(out_idx >= 0 ? fds[out_idx].revents : 0, err_idx >= 0 ? fds[err_idx].revents : 0);
    }
    result.execution_time_ms = timer.duration<chrono::milliseconds>().count();

    stop_watchdog();

    // 子进程结束后，杀死进程组中残留的进程，避免它们持有管道导致读取不到 EOF
    kill(-pid, SIGKILL);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) error(errno, "waiting on child {}", pid);
    }
    reaped = true;

    close_fd(stdin_fd);
    auto drain_deadline = chrono::steady_clock::now() + drain_grace;
    while ((stdout_fd >= 0 || stderr_fd >= 0) && chrono::steady_clock::now() < drain_deadline) {
        struct pollfd fds[2];
        int nfds = 0, out_idx = -1, err_idx = -1;
        if (stdout_fd >= 0) fds[out_idx = nfds++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[err_idx = nfds++] = {stderr_fd, POLLIN, 0};
        int r = poll(fds, nfds, (int)drain_grace.count());
        if (r == -1 && errno != EINTR) error(errno, "draining child output");
        if (r <= 0) continue;
        pump_outputs(out_idx >= 0 ? fds[out_idx].revents : 0, err_idx >= 0 ? fds[err_idx].revents : 0);
    }

    claim(outcome, COMPLETED);
    result.peak_memory_mb = peak_kb.load() / 1024.0;

    switch (outcome.load()) {
        case TIMED_OUT:
            result.success = false;
            result.timeout = true;
            result.exit_code = -1;
            result.kind = error_kind::RUNTIME_TIMEOUT;
            result.error = fmt::format("execution timed out after {}s", request.timeout_seconds);
            break;
        case MEMORY_EXCEEDED:
            result.success = false;
            result.exit_code = -1;
            result.peak_memory_mb = max(result.peak_memory_mb, trigger_kb / 1024.0);
            result.kind = error_kind::MEMORY_LIMIT_EXCEEDED;
            result.error = fmt::format("memory limit exceeded ({:.2f}MB > {}MB)", trigger_kb / 1024.0, request.memory_limit_mb);
            break;
        default:
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
                if (result.exit_code != 0)
                    result.error = fmt::format("process exited with code {}", result.exit_code);
            } else if (WIFSIGNALED(status)) {
                int sig = WTERMSIG(status);
                result.exit_code = 128 + sig;
                result.error = fmt::format("process terminated by signal {} ({})", sig, strsignal(sig));
            } else {
                throw internal_error(fmt::format("unknown status: {:x}", status));
            }
            result.success = result.exit_code == 0;
            result.kind = result.success ? error_kind::NONE : error_kind::NON_ZERO_EXIT;
            break;
    }

    LOG(INFO) << fmt::format("pid {} finished: {}, exit code {}, wall time {}ms, peak memory {:.2f}MB",
                             pid, get_display_message(result.kind), result.exit_code, result.execution_time_ms, result.peak_memory_mb);
    return result;
}

}  // namespace sandbox

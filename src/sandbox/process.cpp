#include "sandbox/process.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <mutex>
#include <system_error>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/limits.hpp"

extern char **environ;

namespace grader {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

// 主进程退出后，等待子孙进程关闭输出管道的最长时间
static const chrono::milliseconds DRAIN_TIMEOUT(1000);

static const int POLL_INTERVAL_MS = 50;
static const int BUF_SIZE = 4096;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

/**
 * @brief 子进程在 exec 之前失败时通过错误管道报告的信息
 */
struct child_failure {
    int stage;
    int err;
};

enum child_stage {
    STAGE_CHDIR = 1,
    STAGE_RLIMIT,
    STAGE_SECCOMP,
    STAGE_REDIRECT,
    STAGE_EXEC
};

static const char *describe_stage(int stage) {
    switch (stage) {
        case STAGE_CHDIR: return "unable to change working directory";
        case STAGE_RLIMIT: return "unable to set resource limits";
        case STAGE_SECCOMP: return "unable to install seccomp filter";
        case STAGE_REDIRECT: return "unable to redirect standard streams";
        default: return "unable to start command";
    }
}

[[noreturn]] static void child_fail(int errfd, int stage, int err) {
    child_failure failure{stage, err};
    ssize_t ignored = write(errfd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "fcntl, setting O_NONBLOCK on fd {}", fd);
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

/**
 * @brief 在 fork 出的子进程中运行，只调用异步信号安全的函数
 */
[[noreturn]] static void run_child(const process_options &opt, char *const *argv, char *const *envp,
                                   int pipefd[3][2], int errfd, const struct sock_fprog *filter) {
    // 独立的进程组，这样命令和它的所有子进程可以用一个信号杀死
    setpgid(0, 0);

    // 恢复默认的信号处理，评测系统自身忽略了 SIGPIPE
    signal(SIGPIPE, SIG_DFL);

    if (!opt.cwd.empty() && chdir(opt.cwd.c_str()) != 0) child_fail(errfd, STAGE_CHDIR, errno);

    int err = 0;
    if (opt.time_limit > 0) {
        // 硬限制比软限制多一秒：到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL
        rlim_t cputime_limit = (rlim_t)ceil(opt.time_limit) + 1;
        err = err ? err : set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }
    if (opt.memory_limit > 0) {
        // RLIMIT_DATA 不计算 PROT_NONE 的预留区域，Java 虚拟机启动时会预留远超堆大小的地址空间
        rlim_t bytes = (rlim_t)opt.memory_limit * 1024;
        err = err ? err : set_rlimit(RLIMIT_DATA, bytes, bytes);
    }
    if (opt.file_limit > 0) err = err ? err : set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit);
    err = err ? err : set_rlimit(RLIMIT_CORE, 0, 0);
    if (err) child_fail(errfd, STAGE_RLIMIT, err);

    if (filter && (err = install_filter(filter)) != 0) child_fail(errfd, STAGE_SECCOMP, err);

    // 将管道连接到 stdin/stdout/stderr
    if (dup2(pipefd[0][PIPE_OUT], STDIN_FILENO) < 0 ||
        dup2(pipefd[1][PIPE_IN], STDOUT_FILENO) < 0 ||
        dup2(pipefd[2][PIPE_IN], STDERR_FILENO) < 0)
        child_fail(errfd, STAGE_REDIRECT, errno);
    for (int i = 0; i < 3; ++i) {
        close(pipefd[i][PIPE_IN]);
        close(pipefd[i][PIPE_OUT]);
    }

    execvpe(argv[0], argv, envp);
    child_fail(errfd, STAGE_EXEC, errno);
}

/**
 * @brief 先尝试 SIGTERM 让进程组正常退出，再用 SIGKILL 强制杀死
 */
static void terminate_group(pid_t pgid) {
    LOG(INFO) << "sending SIGTERM to process group " << pgid;
    if (kill(-pgid, SIGTERM) != 0 && errno != ESRCH) error(errno, "sending SIGTERM to command");

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pgid;
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH) error(errno, "sending SIGKILL to command");
}

static void read_stream(int &fd, string &buffer, bool &truncated, size_t cap) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            error(errno, "reading output of child process");
        }
        if (nread == 0) {
            // EOF detected: close fd and indicate this with -1
            close_fd(fd);
            return;
        }
        // 超出上限的数据继续读出并丢弃，避免子进程因为管道写满而阻塞
        size_t room = cap > buffer.size() ? cap - buffer.size() : 0;
        if ((size_t)nread > room) truncated = true;
        buffer.append(buf, min(room, (size_t)nread));
    }
}

static void write_stdin(int &fd, const string &data, size_t &written) {
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            // 子进程不读取标准输入就退出时会得到 EPIPE，这不是错误
            if (errno == EPIPE) break;
            error(errno, "writing input of child process");
        }
        written += n;
    }
    close_fd(fd);
}

static void record_status(int status, process_result &result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = result.signal + 128;
        LOG(INFO) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    }
}

process_result run_process(const process_options &opt) {
    if (opt.args.empty()) throw invalid_argument("run_process: empty command");

    // 向已经退出的子进程写入标准输入时不能让评测系统收到 SIGPIPE
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    const struct sock_fprog *filter = opt.isolate_network ? network_filter() : nullptr;

    // fork 之后不能分配内存，参数与环境变量需要提前准备好
    vector<string> args = opt.args;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    vector<string> env;
    for (char **e = environ; e && *e; ++e) env.emplace_back(*e);
    append(env, opt.env);
    vector<char *> envp;
    for (auto &entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    int pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int errpipe[2] = {-1, -1};
    auto close_all = [&] {
        for (auto &p : pipefd) close_fd(p[0]), close_fd(p[1]);
        close_fd(errpipe[0]), close_fd(errpipe[1]);
    };

    for (int i = 0; i < 3; ++i)
        if (pipe2(pipefd[i], O_CLOEXEC) != 0) {
            int err = errno;
            close_all();
            error(err, "creating pipe for fd {}", i);
        }
    if (pipe2(errpipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        error(err, "creating error pipe");
    }

    elapsed_time timer;
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close_all();
        error(err, "unable to fork");
    }
    if (pid == 0) run_child(opt, argv.data(), envp.data(), pipefd, errpipe[PIPE_IN], filter);

    // 父进程也设置一次进程组，避免子进程还没来得及调用 setpgid 时就需要杀死进程组
    setpgid(pid, pid);

    close_fd(pipefd[0][PIPE_OUT]);
    close_fd(pipefd[1][PIPE_IN]);
    close_fd(pipefd[2][PIPE_IN]);
    close_fd(errpipe[PIPE_IN]);

    process_result result;
    int &in = pipefd[0][PIPE_IN], &out = pipefd[1][PIPE_OUT], &err = pipefd[2][PIPE_OUT];
    size_t written = 0;

    try {
        set_nonblocking(in);
        set_nonblocking(out);
        set_nonblocking(err);
        if (opt.stdin_data.empty()) close_fd(in);

        auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(opt.time_limit));
        chrono::steady_clock::time_point drain_deadline;
        bool exited = false;
        int status = 0;

        while (true) {
            if (!exited) {
                pid_t r = waitpid(pid, &status, WNOHANG);
                if (r == -1 && errno != EINTR) error(errno, "waiting on child");
                if (r == pid) {
                    exited = true;
                    // 杀死进程组内剩余的进程，子孙进程不能比主进程活得更久
                    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH) error(errno, "killing process group");
                    drain_deadline = chrono::steady_clock::now() + DRAIN_TIMEOUT;
                }
            }

            if (exited && out < 0 && err < 0) break;

            auto now = chrono::steady_clock::now();
            if (!exited && opt.time_limit > 0 && now >= deadline) {
                LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command {}", opt.time_limit, args[0]);
                result.timed_out = true;
                terminate_group(pid);
                if (waitpid(pid, &status, 0) == -1) error(errno, "waiting on child");
                exited = true;
                drain_deadline = chrono::steady_clock::now() + DRAIN_TIMEOUT;
                continue;
            }
            if (exited && now >= drain_deadline) {
                LOG(WARNING) << "Output pipes of " << args[0] << " are still open after the process exited, closing them";
                break;
            }

            vector<pollfd> fds;
            if (out >= 0) fds.push_back({out, POLLIN, 0});
            if (err >= 0) fds.push_back({err, POLLIN, 0});
            if (in >= 0) fds.push_back({in, POLLOUT, 0});
            int r = poll(fds.data(), fds.size(), POLL_INTERVAL_MS);
            if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
            if (r <= 0) continue;

            for (auto &pfd : fds) {
                if (!pfd.revents) continue;
                if (pfd.fd == out) read_stream(out, result.out, result.out_truncated, opt.stream_size);
                else if (pfd.fd == err) read_stream(err, result.err, result.err_truncated, opt.stream_size);
                else if (pfd.fd == in) {
                    if (pfd.revents & (POLLERR | POLLHUP)) close_fd(in);
                    else write_stdin(in, opt.stdin_data, written);
                }
            }
        }

        record_status(status, result);
    } catch (...) {
        // 出现系统错误时也不能留下失控的子进程
        kill(-pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        close_all();
        throw;
    }

    child_failure failure{};
    ssize_t n;
    while ((n = read(errpipe[PIPE_OUT], &failure, sizeof(failure))) == -1 && errno == EINTR)
        ;
    if (n == (ssize_t)sizeof(failure)) {
        result.exit_code = 127;
        result.signal = 0;
        result.err += fmt::format("{} {}: {}\n", describe_stage(failure.stage), args[0], strerror(failure.err));
        LOG(WARNING) << describe_stage(failure.stage) << " " << args[0] << ": " << strerror(failure.err);
    }
    close_all();

    result.wall_time = timer.seconds();
    return result;
}

}  // namespace grader

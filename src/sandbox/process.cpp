#include "sandbox/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <chrono>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace funcjudge::sandbox {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

// 每次最多连续读取的次数，避免持续输出的子进程使父进程无法检查时间限制
static const int MAX_READS_PER_PUMP = 16;

static const int POLL_INTERVAL_MS = 50;
static const int IDLE_INTERVAL_MS = 5;
static const int DRAIN_TIMEOUT_MS = 500;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

// child_pipefd[EXEC_PIPE] 用于子进程报告 exec 失败的 errno，
// 写端带有 O_CLOEXEC，exec 成功后父进程读到 EOF
static const int EXEC_PIPE = 0;

template <typename... Args>
static internal_error error(int err, const char *format, const Args &... args) {
    return internal_error(fmt::format(fmt::runtime(format), args...) + ": " + strerror(err));
}

/**
 * @brief 读出管道中当前可读的数据
 * 保存的数据不超过 limit 字节，超出的部分读出后丢弃并标记截断
 * @param fd 管道读端，读到 EOF 时关闭并置为 -1
 */
static void pump_pipe(int &fd, string &text, bool &truncated, int64_t limit) {
    char buf[BUF_SIZE];
    for (int i = 0; i < MAX_READS_PER_PUMP && fd >= 0; ++i) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw error(errno, "reading output of child process");
        }
        if (nread == 0) {
            close(fd);
            fd = -1;
            return;
        }

        size_t keep = nread;
        if (limit >= 0 && text.size() + nread > (size_t)limit) {
            keep = (size_t)limit - text.size();
            truncated = true;
        }
        text.append(buf, keep);
    }
}

static int poll_pipes(int child_pipefd[3][2], int timeout_ms) {
    struct pollfd fds[2];
    int nfds = 0;
    for (int i = STDOUT_FILENO; i <= STDERR_FILENO; ++i) {
        if (child_pipefd[i][PIPE_OUT] >= 0) {
            fds[nfds].fd = child_pipefd[i][PIPE_OUT];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
    }
    if (nfds == 0) return 0;
    int r = poll(fds, nfds, timeout_ms);
    if (r < 0 && errno != EINTR) throw error(errno, "waiting for child data");
    return r;
}

raw_process_result run_process(const process_options &opt) {
    if (opt.command.empty()) throw internal_error("empty command");

    raw_process_result result;

    string stdin_path = opt.stdin_file.empty() ? "/dev/null" : opt.stdin_file.string();
    int stdin_fd = open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd < 0) throw error(errno, "opening stdin file {}", stdin_path);
    defer { close(stdin_fd); };

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    defer {
        for (auto &p : child_pipefd)
            for (int fd : p)
                if (fd >= 0) close(fd);
    };
    for (int i = 0; i < 3; ++i) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) throw error(errno, "creating pipe for fd {}", i);
    }

    // fork 之后的子进程中不能分配内存，参数提前准备好
    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string workdir = opt.working_dir.string();

    LOG(INFO) << "running command: " << boost::algorithm::join(opt.command, " ");

    elapsed_time timer;
    pid_t child_pid = fork();
    if (child_pid < 0) throw error(errno, "unable to fork");

    if (child_pid == 0) {
        // 放入独立的进程组，超时时可以杀死子进程创建的所有进程
        setpgid(0, 0);

        int err = 0;
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            err = errno;
        } else if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
                   dup2(child_pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0 ||
                   dup2(child_pipefd[STDERR_FILENO][PIPE_IN], STDERR_FILENO) < 0) {
            err = errno;
        } else {
            execvp(args[0], args.data());
            err = errno;
        }
        if (write(child_pipefd[EXEC_PIPE][PIPE_IN], &err, sizeof(err)) != sizeof(err)) _exit(126);
        _exit(127);
    }

    // 父进程也设置一次，保证 kill(-child_pid) 时进程组已经存在。
    // 子进程已经 exec 时会返回 EACCES，此时子进程自己已经设置过了
    setpgid(child_pid, child_pid);

    bool reaped = false;
    int status = 0;
    defer {
        if (!reaped) {
            kill(-child_pid, SIGKILL);
            while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) continue;
        }
    };

    for (auto &p : child_pipefd) {
        close(p[PIPE_IN]);
        p[PIPE_IN] = -1;
    }

    {
        int exec_errno = 0;
        ssize_t n;
        do {
            n = read(child_pipefd[EXEC_PIPE][PIPE_OUT], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        if (n < 0) throw error(errno, "reading exec status of child");
        if (n == sizeof(exec_errno)) throw error(exec_errno, "unable to start command {}", opt.command[0]);
    }

    for (int i = STDOUT_FILENO; i <= STDERR_FILENO; ++i) {
        int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1)
            throw error(errno, "fcntl, setting flags of fd {}", i);
    }

    auto pump_all = [&]() {
        pump_pipe(child_pipefd[STDOUT_FILENO][PIPE_OUT], result.stdout_text, result.stdout_truncated, opt.output_limit);
        pump_pipe(child_pipefd[STDERR_FILENO][PIPE_OUT], result.stderr_text, result.stderr_truncated, opt.output_limit);
    };

    // 用 WNOWAIT 检查子进程是否退出但不回收，在回收前进程组号不会被复用
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(opt.timeout_ms);
    bool exited = false;
    while (true) {
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0 && errno != EINTR)
            throw error(errno, "waiting on child");
        if (info.si_pid == child_pid) {
            exited = true;
            break;
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) break;

        int64_t remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;
        bool has_pipes = child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0;
        int interval = has_pipes ? POLL_INTERVAL_MS : IDLE_INTERVAL_MS;
        if (has_pipes) {
            poll_pipes(child_pipefd, (int)min<int64_t>(interval, remaining));
            pump_all();
        } else {
            struct timespec idle = {0, (long)min<int64_t>(interval, remaining) * 1000000L};
            nanosleep(&idle, nullptr);
        }
    }
    result.elapsed_ms = timer.milliseconds();

    if (!exited) {
        result.timed_out = true;
        LOG(WARNING) << "time limit exceeded (" << opt.timeout_ms << "ms): aborting command " << opt.command[0];

        /* First try to kill graciously, then hard. */
        if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH) throw error(errno, "sending SIGTERM to command");
        nanosleep(&killdelay, nullptr);
    }

    // 子进程已经结束，同时杀死它遗留在进程组中的后台进程
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) throw error(errno, "sending SIGKILL to command");

    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) throw error(errno, "waiting on child");
    }
    reaped = true;

    // 读出管道中剩余的数据，脱离了进程组的进程可能一直持有管道，因此限制等待时间
    auto drain_deadline = chrono::steady_clock::now() + chrono::milliseconds(DRAIN_TIMEOUT_MS);
    while (child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0) {
        auto now = chrono::steady_clock::now();
        if (now >= drain_deadline) break;
        int remaining = (int)chrono::duration_cast<chrono::milliseconds>(drain_deadline - now).count() + 1;
        if (poll_pipes(child_pipefd, remaining) == 0) break;
        pump_all();
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = result.signal + 128;
        if (!result.timed_out)
            LOG(WARNING) << "command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }

    if (result.stdout_truncated)
        LOG(WARNING) << "stdout of " << opt.command[0] << " truncated to " << opt.output_limit << " bytes";
    if (result.stderr_truncated)
        LOG(WARNING) << "stderr of " << opt.command[0] << " truncated to " << opt.output_limit << " bytes";

    return result;
}

}  // namespace funcjudge::sandbox

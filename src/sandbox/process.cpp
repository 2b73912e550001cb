#include "codejudge/sandbox/process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <mutex>
#include "codejudge/common/defer.hpp"
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

static const size_t BUF_SIZE = 4096;

// poll 的最长等待时间（毫秒），决定了检查取消和超时的粒度
static const int POLL_INTERVAL = 10;

bool execution_result::succeeded() const {
    return !timed_out && !cancelled && exitcode == 0 && signal == 0;
}

/**
 * @brief 选手程序提前关闭标准输入时，评测机写入管道会收到 SIGPIPE
 * 忽略该信号，改为由 write 返回 EPIPE
 */
static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        if (close(fd) != 0)
            LOG(WARNING) << "Unable to close fd " << fd << ": " << strerror(errno);
        fd = -1;
    }
}

static void create_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw internal_error(fmt::format("Unable to create pipe: {}", strerror(errno)));
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw internal_error(fmt::format("Unable to set O_NONBLOCK: {}", strerror(errno)));
}

static void kill_group(pid_t pgid) {
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "Unable to send SIGKILL to process group " << pgid << ": " << strerror(errno);
}

/**
 * @brief 从管道读取数据，超过 limit 的部分丢弃
 * @return 管道是否仍然打开
 */
static bool pump_output(int &fd, string &buffer, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            size_t keep = min((size_t)nread, limit - min(limit, buffer.size()));
            buffer.append(buf, keep);
            if (keep < (size_t)nread) truncated = true;
            continue;
        }
        if (nread == 0) {
            close_fd(fd);
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        throw internal_error(fmt::format("Unable to read from child: {}", strerror(errno)));
    }
}

/**
 * @brief 向子进程的标准输入写入数据，写完或者子进程关闭标准输入后关闭管道
 */
static void pump_input(int &fd, const string &input, size_t &written) {
    while (written < input.size()) {
        ssize_t nwritten = write(fd, input.data() + written, input.size() - written);
        if (nwritten >= 0) {
            written += nwritten;
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        if (errno == EPIPE) break;
        throw internal_error(fmt::format("Unable to write to child: {}", strerror(errno)));
    }
    close_fd(fd);
}

execution_result run_process(const process_options &options) {
    if (options.command.empty())
        throw internal_error("Empty command");
    if (options.cancel.cancelled()) {
        execution_result result;
        result.cancelled = true;
        return result;
    }
    ignore_sigpipe();

    size_t output_limit = options.output_limit ? options.output_limit : OUTPUT_LIMIT;

    // fork 之后子进程中不再分配内存，提前准备好 argv
    vector<char *> argv;
    for (auto &arg : options.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = options.workdir.string();

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };
    create_pipe(stdin_pipe);
    create_pipe(stdout_pipe);
    create_pipe(stderr_pipe);
    // 用于报告 exec 失败，exec 成功后由 O_CLOEXEC 自动关闭
    create_pipe(error_pipe);

    pid_t pid = fork();
    if (pid == -1)
        throw internal_error(fmt::format("Unable to fork: {}", strerror(errno)));

    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        int err = 0;
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[1], STDERR_FILENO) < 0 ||
            (!workdir.empty() && chdir(workdir.c_str()) != 0)) {
            err = errno;
        } else {
            execvp(argv[0], argv.data());
            err = errno;
        }
        if (write(error_pipe[1], &err, sizeof(err)) < 0) _exit(126);
        _exit(127);
    }

    // 父进程也设置一次进程组，避免子进程还没有调用 setpgid 时就需要杀死进程组
    setpgid(pid, pid);
    bool reaped = false;
    int status = 0;
    defer {
        // 回收之后 pgid 可能已经被复用，不能再发送信号
        if (!reaped) {
            kill_group(pid);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
    };

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(error_pipe[1]);

    int exec_errno = 0;
    ssize_t nread;
    while ((nread = read(error_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    close_fd(error_pipe[0]);
    if (nread > 0) {
        waitpid(pid, &status, 0);
        reaped = true;
        throw internal_error(fmt::format("Unable to execute {}: {}", options.command[0], strerror(exec_errno)));
    }

    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    execution_result result;
    elapsed_time timer;
    size_t written = 0;
    bool exited = false;
    if (options.input.empty()) close_fd(stdin_pipe[1]);

    while (!exited || stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0) {
        vector<pollfd> fds;
        if (stdin_pipe[1] >= 0) fds.push_back({stdin_pipe[1], POLLOUT, 0});
        if (stdout_pipe[0] >= 0) fds.push_back({stdout_pipe[0], POLLIN, 0});
        if (stderr_pipe[0] >= 0) fds.push_back({stderr_pipe[0], POLLIN, 0});

        if (poll(fds.data(), fds.size(), POLL_INTERVAL) < 0 && errno != EINTR)
            throw internal_error(fmt::format("Unable to poll child pipes: {}", strerror(errno)));

        if (stdin_pipe[1] >= 0) pump_input(stdin_pipe[1], options.input, written);
        if (stdout_pipe[0] >= 0) pump_output(stdout_pipe[0], result.output, output_limit, result.output_truncated);
        if (stderr_pipe[0] >= 0) pump_output(stderr_pipe[0], result.error, output_limit, result.output_truncated);

        if (!exited) {
            // 只检查子进程是否退出，暂不回收，保证杀死进程组时 pgid 仍然有效
            siginfo_t info;
            info.si_pid = 0;
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0 && errno != EINTR)
                throw internal_error(fmt::format("Unable to wait for child: {}", strerror(errno)));
            if (info.si_pid == pid) {
                exited = true;
                result.wall_time = timer.milliseconds();
                // 子进程已经退出，杀死它遗留在进程组中的子进程，管道随之关闭
                kill_group(pid);
            } else if (options.cancel.cancelled()) {
                LOG(INFO) << "Evaluation cancelled, killing " << options.command[0];
                result.cancelled = true;
                kill_group(pid);
            } else if (options.time_limit > 0 && timer.milliseconds() > options.time_limit * 1000) {
                DLOG(INFO) << "Time limit exceeded, killing " << options.command[0];
                result.timed_out = true;
                kill_group(pid);
            }
        } else if (options.time_limit > 0 && timer.milliseconds() > options.time_limit * 1000) {
            // 脱离了进程组的后代进程仍然持有管道，不再等待
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
        }
    }

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw internal_error(fmt::format("Unable to reap child: {}", strerror(errno)));
    }
    reaped = true;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
    }
    return result;
}

}  // namespace codejudge

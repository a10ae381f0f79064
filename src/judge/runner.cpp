#include "cpjudge/judge/runner.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <limits>
#include "cpjudge/common/defer.hpp"
#include "cpjudge/common/exceptions.hpp"
#include "cpjudge/common/io_utils.hpp"
#include "cpjudge/common/stl_utils.hpp"
#include "cpjudge/common/utils.hpp"
#include "cpjudge/config.hpp"

namespace cpjudge {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw internal_error(fmt::format(args...) + ": " + strerror(err));
}

bool execution_result::succeeded() const {
    return !timed_out && exit_code == 0;
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

static vector<char *> make_argv(vector<string> &list) {
    vector<char *> argv;
    for (auto &arg : list)
        argv.push_back(arg.data());
    argv.push_back(nullptr);
    return argv;
}

/**
 * @brief 读取管道中的数据
 * @param block 管道是否为阻塞模式。阻塞模式下只读取一次（调用前已经通过 poll 确认可读），
 *              非阻塞模式下读空管道为止
 * @return 若管道已经关闭（读到 EOF）则返回 true
 */
static bool pump_pipe(int fd, string &buffer, bool block) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            buffer.append(buf, nread);
            if (!block) continue;
            return false;
        }
        if (nread == 0) return true;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
        error(errno, "reading child output");
    }
}

static void set_status(execution_result &result, int status) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
        result.exit_code = result.signal + 128;
        LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }
}

static void kill_process_group(pid_t pid) {
    // 先杀死整个进程组，再单独杀死子进程以防子进程还没来得及设置进程组
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to " << pid << ": " << strerror(errno);
}

execution_result run(const string &command, const vector<string> &args,
                     const fs::path &input_path, const fs::path &output_path,
                     int time_limit) {
    int input_fd = open(input_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (input_fd < 0) throw file_not_found_error(input_path.string());
    defer { close_fd(input_fd); };

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    defer {
        for (int i = 1; i <= 2; ++i) {
            close_fd(child_pipefd[i][PIPE_IN]);
            close_fd(child_pipefd[i][PIPE_OUT]);
        }
    };
    for (int i = 1; i <= 2; ++i) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }

    vector<string> cmd{command};
    append(cmd, args);
    auto argv = make_argv(cmd);
    LOG(INFO) << "Running " << boost::algorithm::join(cmd, " ") << " < " << input_path
              << " with time limit " << time_limit << "ms";

    execution_result result;
    elapsed_time timer;
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(time_limit) + chrono::milliseconds(TIME_LIMIT_GRACE);

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // child process, run the command
            setpgid(0, 0);
            if (dup2(input_fd, STDIN_FILENO) < 0) _exit(127);
            // 将管道连接到 stdout/stderr，其余文件描述符在 exec 时自动关闭
            for (int i = 1; i <= 2; ++i)
                if (dup2(child_pipefd[i][PIPE_IN], i) < 0) _exit(127);

            execvp(argv[0], argv.data());
            fprintf(stderr, "unable to start command %s: %s\n", argv[0], strerror(errno));
            _exit(127);
        }
        default:
            break;
    }

    // 父进程与子进程都设置进程组，避免 kill 时子进程还没有执行 setpgid
    setpgid(child_pid, child_pid);
    for (int i = 1; i <= 2; ++i) close_fd(child_pipefd[i][PIPE_IN]);

    int pidfd = (int)syscall(SYS_pidfd_open, child_pid, 0);
    if (pidfd < 0) {
        int err = errno;
        kill_process_group(child_pid);
        waitpid(child_pid, nullptr, 0);
        error(err, "watching child process {}", child_pid);
    }
    defer { close_fd(pidfd); };

    string *buffers[3] = {nullptr, &result.output, &result.error};
    int status = 0;
    bool exited = false;
    while (!exited) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
            kill_process_group(child_pid);
            while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {}
            result.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        int fd_index[3];
        nfds_t nfds = 0;
        fds[nfds] = {pidfd, POLLIN, 0};
        fd_index[nfds++] = 0;
        for (int i = 1; i <= 2; ++i) {
            if (child_pipefd[i][PIPE_OUT] >= 0) {
                fds[nfds] = {child_pipefd[i][PIPE_OUT], POLLIN, 0};
                fd_index[nfds++] = i;
            }
        }

        // 时间限制可以接近 INT_MAX，加上宽限时间后会超出 poll 的参数范围
        int r = poll(fds, nfds, (int)min<long long>(remaining, numeric_limits<int>::max()));
        if (r == -1) {
            if (errno == EINTR) continue;
            int err = errno;
            kill_process_group(child_pid);
            waitpid(child_pid, nullptr, 0);
            error(err, "waiting for child data");
        }

        for (nfds_t k = 0; k < nfds; ++k) {
            if (!fds[k].revents) continue;
            int i = fd_index[k];
            if (i == 0) {
                while (waitpid(child_pid, &status, 0) < 0) {
                    if (errno != EINTR) error(errno, "waiting on child");
                }
                exited = true;
            } else if (pump_pipe(child_pipefd[i][PIPE_OUT], *buffers[i], true)) {
                close_fd(child_pipefd[i][PIPE_OUT]);
            }
        }
    }

    result.elapsed = timer.duration<chrono::milliseconds>();

    if (result.timed_out) {
        result.output.clear();
        result.error.clear();
        LOG(INFO) << "Command killed after " << result.elapsed.count() << "ms";
        return result;
    }

    // 子进程已经退出，读出管道中剩余的数据。子进程 fork 出的进程可能仍然持有管道，
    // 因此使用非阻塞读，若管道仍未关闭则杀死进程组中残留的进程
    bool stragglers = false;
    for (int i = 1; i <= 2; ++i) {
        if (child_pipefd[i][PIPE_OUT] < 0) continue;
        int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "fcntl, setting flags");
        if (!pump_pipe(child_pipefd[i][PIPE_OUT], *buffers[i], false))
            stragglers = true;
    }
    if (stragglers && kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << child_pid << ": " << strerror(errno);

    set_status(result, status);
    LOG(INFO) << "Command exited with code " << result.exit_code << " in " << result.elapsed.count() << "ms";

    if (result.succeeded()) {
        write_file_content(output_path, result.output);
        LOG(INFO) << "Output written to " << output_path;
    }
    return result;
}

int run_interactive(const string &command, const vector<string> &args,
                    const optional<fs::path> &input_path) {
    int input_fd = -1;
    if (input_path) {
        input_fd = open(input_path->c_str(), O_RDONLY | O_CLOEXEC);
        if (input_fd < 0) throw file_not_found_error(input_path->string());
    }
    defer { close_fd(input_fd); };

    vector<string> cmd{command};
    append(cmd, args);
    auto argv = make_argv(cmd);
    LOG(INFO) << "Running " << boost::algorithm::join(cmd, " ") << " in debug mode";

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {
            if (input_fd >= 0 && dup2(input_fd, STDIN_FILENO) < 0) _exit(127);
            execvp(argv[0], argv.data());
            fprintf(stderr, "unable to start command %s: %s\n", argv[0], strerror(errno));
            _exit(127);
        }
        default:
            break;
    }

    int status;
    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }

    execution_result result;
    set_status(result, status);
    return result.exit_code;
}

vector<string> split_command(const string &command) {
    vector<string> tokens;
    boost::split(tokens, command, boost::is_any_of(" \t\n"), boost::token_compress_on);
    tokens.erase(remove(tokens.begin(), tokens.end(), ""), tokens.end());
    if (tokens.empty())
        throw configuration_error("command is empty");
    return tokens;
}

}  // namespace cpjudge

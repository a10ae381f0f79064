#include "cpjudge/common/utils.hpp"
#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>
#include <system_error>

namespace cpjudge {
using namespace std;

int exec_program(const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // 子进程
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "waiting on child");
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
    return 0;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace cpjudge

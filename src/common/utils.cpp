#include "common/utils.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <csignal>
#include <system_error>
using namespace std;

int exec_program(const filesystem::path &cwd, const map<string, string> &env, const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            if (!cwd.empty() && chdir(cwd.c_str()) != 0)
                _exit(EXIT_FAILURE);
            for (auto &[key, value] : env)
                set_env(key, value);
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            if (waitpid(pid, &status, 0) == -1)
                throw system_error(errno, system_category(), "unable to wait for " + string(argv[0]));
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string random_id() {
    // random_generator 不是线程安全的，每个线程持有一个
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstring>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// 地址空间比内存限制多出的余量，运行时库的映射也计入地址空间
static constexpr rlim_t AS_HEADROOM = 64 << 20;

static double to_seconds(const timeval &tv) {
    return tv.tv_sec + tv.tv_usec / 1e6;
}

/**
 * @brief 子进程中执行，只能调用异步信号安全的函数
 */
[[noreturn]] static void exec_child(int error_pipe, const char *box, const char *in, const char *out, const char *err,
                                    const resource_limits &limits, char **argv) {
    setpgid(0, 0);
    signal(SIGINT, SIG_DFL);

    int fail = 0;
    if (chdir(box) != 0) fail = errno;

    if (!fail) {
        int fd_in = open(in, O_RDONLY);
        int fd_out = open(out, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        int fd_err = open(err, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd_in < 0 || fd_out < 0 || fd_err < 0 ||
            dup2(fd_in, STDIN_FILENO) < 0 || dup2(fd_out, STDOUT_FILENO) < 0 || dup2(fd_err, STDERR_FILENO) < 0)
            fail = errno;
    }

    if (!fail) {
        struct rlimit lim;
        lim.rlim_cur = lim.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &lim);

        if (limits.cpu_time > 0) {
            lim.rlim_cur = (rlim_t)ceil(limits.cpu_time);
            lim.rlim_max = lim.rlim_cur + 1;
            if (setrlimit(RLIMIT_CPU, &lim) != 0) fail = errno;
        }
        if (!fail && limits.memory > 0) {
            // 地址空间限制只用来兜底，是否超出内存限制由峰值常驻内存判定
            lim.rlim_cur = lim.rlim_max = limits.memory * 2 + AS_HEADROOM;
            if (setrlimit(RLIMIT_AS, &lim) != 0) fail = errno;
        }
    }

    if (!fail) {
        execvp(argv[0], argv);
        fail = errno;
    }

    // 通知父进程 exec 失败，这属于沙箱错误而不是选手程序的运行时错误
    ssize_t written = write(error_pipe, &fail, sizeof(fail));
    (void)written;
    _exit(127);
}

void process_sandbox::execute(const fs::path &dir, const fs::path &box, const execution &exec, execution_result &result) {
    // fork 之后子进程不能分配内存，所有参数需要提前准备好
    vector<string> args = exec.command;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    string box_path = box.string();
    string in_path = exec.stdin_file.empty() ? string("/dev/null") : (box / exec.stdin_file).string();
    string out_path = (dir / ".stdout").string();
    string err_path = (dir / ".stderr").string();

    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) != 0)
        BOOST_THROW_EXCEPTION(internal_error(string("unable to create pipe: ") + strerror(errno)));

    elapsed_time timer;
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(error_pipe[0]);
        close(error_pipe[1]);
        BOOST_THROW_EXCEPTION(internal_error(string("unable to fork: ") + strerror(err)));
    }
    if (pid == 0) {
        close(error_pipe[0]);
        exec_child(error_pipe[1], box_path.c_str(), in_path.c_str(), out_path.c_str(), err_path.c_str(), exec.limits, argv.data());
    }
    // 父进程也设置一次进程组，避免子进程还没来得及设置时就需要被杀死
    setpgid(pid, pid);
    close(error_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close(error_pipe[0]);

    bool wall_exceeded = false;
    int stat = 0;
    struct rusage usage;
    while (true) {
        pid_t ret = wait4(pid, &stat, WNOHANG, &usage);
        if (ret == pid) break;
        if (ret == -1 && errno != EINTR) {
            int err = errno;
            kill(-pid, SIGKILL);
            BOOST_THROW_EXCEPTION(internal_error(string("unable to wait for child: ") + strerror(err)));
        }
        if (!wall_exceeded && exec.limits.wall_time > 0 &&
            timer.duration<chrono::milliseconds>().count() > exec.limits.wall_time * 1000) {
            wall_exceeded = true;
            kill(-pid, SIGKILL);
        }
        this_thread::sleep_for(chrono::milliseconds(5));
    }
    // 清理进程组中残留的子进程
    kill(-pid, SIGKILL);

    result.wall_time = timer.duration<chrono::milliseconds>().count() / 1000.0;
    result.time_used = to_seconds(usage.ru_utime) + to_seconds(usage.ru_stime);
    result.memory_used = (size_t)usage.ru_maxrss * 1024;

    if (n == sizeof(exec_errno) && exec_errno != 0) {
        result.stat = status::SANDBOX_ERROR;
        result.message = "unable to execute " + exec.command[0] + ": " + strerror(exec_errno);
        return;
    }

    if (WIFEXITED(stat)) result.exitcode = WEXITSTATUS(stat);
    if (WIFSIGNALED(stat)) result.signal = WTERMSIG(stat);

    if (wall_exceeded ||
        (exec.limits.cpu_time > 0 && result.time_used > exec.limits.cpu_time) ||
        result.signal == SIGXCPU)
        result.stat = status::TIME_LIMIT_EXCEEDED;
    else if (exec.limits.memory > 0 && result.memory_used >= exec.limits.memory)
        result.stat = status::MEMORY_LIMIT_EXCEEDED;
    else if (result.signal != -1 || result.exitcode != 0)
        result.stat = status::RUNTIME_ERROR;
    else
        result.stat = status::OK;
}

}  // namespace grader

#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 沙箱的资源限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制，单位为秒，不大于 0 表示不限制
     */
    double cpu_time = 0;

    /**
     * @brief 时钟时间限制，单位为秒，不大于 0 表示不限制
     */
    double wall_time = 0;

    /**
     * @brief 内存限制，单位为字节，为 0 表示不限制
     */
    size_t memory = 0;
};

/**
 * @brief 一次沙箱执行的描述
 */
struct execution {
    /**
     * @brief 要执行的命令，command[0] 为程序路径，相对路径在私有目录下解析
     */
    std::vector<std::string> command;

    /**
     * @brief 预置到私有目录中的文件，文件名 -> 文件内容
     */
    std::map<std::string, std::string> input_files;

    /**
     * @brief 需要设置可执行权限的文件名
     */
    std::set<std::string> executables;

    /**
     * @brief 作为标准输入的文件名，为空时标准输入为 /dev/null
     */
    std::string stdin_file;

    /**
     * @brief 执行结束后需要收集的文件名
     */
    std::vector<std::string> output_files;

    resource_limits limits;
};

/**
 * @brief 沙箱执行的结果
 */
struct execution_result {
    status stat = status::SANDBOX_ERROR;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief CPU 时间（用户时间 + 系统时间），单位为秒
     */
    double time_used = 0;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 内存使用峰值，单位为字节
     */
    size_t memory_used = 0;

    /**
     * @brief 标准输出，超出 MAX_OUTPUT_BYTES 的部分被截断
     */
    std::string stdout_data;

    /**
     * @brief 标准错误，超出 MAX_OUTPUT_BYTES 的部分被截断
     */
    std::string stderr_data;

    /**
     * @brief 收集到的输出文件，不存在的文件不会出现在这里
     */
    std::map<std::string, std::string> output_files;

    /**
     * @brief 沙箱出错时的错误信息
     */
    std::string message;
};

/**
 * @brief 沙箱执行器
 * 每次执行都会在 RUN_DIR 下创建新的私有目录，执行结束后无论成功与否都会删除，
 * 因此多次执行之间不会共享任何文件。同一个 sandbox 对象可以被多个线程同时使用。
 *
 * 私有目录的布局：
 * sandbox-<uuid>
 * ├── box      // 被执行程序的工作目录，预置了输入文件
 * ├── .stdout  // 标准输出
 * ├── .stderr  // 标准错误
 * └── .meta    // runguard 的运行信息
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 在私有目录中执行命令
     * 沙箱内部的任何错误都会被转换为 SANDBOX_ERROR，这个函数不会抛出异常。
     */
    virtual execution_result run(const execution &exec);

protected:
    /**
     * @brief 执行命令并填写 result 中的运行状态
     * @param dir 私有目录，stdout/stderr/meta 文件应当写在这个目录下
     * @param box 被执行程序的工作目录
     */
    virtual void execute(const std::filesystem::path &dir, const std::filesystem::path &box, const execution &exec, execution_result &result) = 0;
};

/**
 * @brief 基于 fork/exec 和 setrlimit 的沙箱，不需要特权
 * CPU 时间和地址空间由 setrlimit 限制，时钟时间由父进程杀死整个进程组来限制。
 * 不提供文件系统隔离，只用于开发环境和测试。
 */
struct process_sandbox : public sandbox {
protected:
    void execute(const std::filesystem::path &dir, const std::filesystem::path &box, const execution &exec, execution_result &result) override;
};

/**
 * @brief 通过 runguard 执行命令的沙箱
 * runguard 负责 cgroup 和 chroot 的隔离，结果从 meta 文件中读取。
 */
struct runguard_sandbox : public sandbox {
    /**
     * @param runguard runguard 可执行文件的路径
     * @param extra_args 额外传给 runguard 的参数，比如 -u 和 -r
     */
    explicit runguard_sandbox(const std::filesystem::path &runguard, const std::vector<std::string> &extra_args = {});

protected:
    void execute(const std::filesystem::path &dir, const std::filesystem::path &box, const execution &exec, execution_result &result) override;

private:
    std::filesystem::path runguard;
    std::vector<std::string> extra_args;
};

}  // namespace grader

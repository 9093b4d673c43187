#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief runguard 写入 meta 文件的运行信息
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief runguard 自身出错的原因，为空表示 runguard 正常工作
     */
    std::string internal_error;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    long long memory = -1;

    /**
     * @brief 为空表示没有超时，否则为 soft-timelimit 或 hard-timelimit
     */
    std::string time_result;
};

/**
 * @brief 解析 runguard 的 meta 文件，每行格式为 "key: value"
 * 无法解析的字段保持默认值
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace grader

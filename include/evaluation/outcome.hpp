#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace grader {

/**
 * @brief 执行一个操作的结果，由 worker 返回给 evaluation_service
 * 所有输出内容都已经保存到对象存储，这里只保存摘要
 */
struct outcome {
    status stat = status::SANDBOX_ERROR;

    std::string stdout_digest;

    std::string stderr_digest;

    /**
     * @brief CPU 时间，单位为秒
     */
    double time_used = 0;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 内存使用，单位为字节
     */
    size_t memory_used = 0;

    /**
     * @brief 评测操作的输出文件（或者标准输出）的摘要
     */
    std::string output_digest;

    /**
     * @brief 编译操作产生的可执行文件的摘要，编译失败时为空
     */
    std::string executable_digest;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 给管理员看的附加信息，比如沙箱错误的原因
     */
    std::string message;

    /**
     * @brief 构造一个基础设施错误的结果
     * 传输层错误和沙箱错误使用同样的结果，evaluation_service 只有一条处理路径
     */
    static outcome infrastructure_failure(const std::string &message);
};

void to_json(nlohmann::json &j, const outcome &o);
void from_json(const nlohmann::json &j, outcome &o);

}  // namespace grader

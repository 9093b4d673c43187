#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief 表示一次沙箱执行（编译或者评测一个数据点）的结果
 */
enum class status {
    /**
     * @brief 程序正常退出，且返回值为 0
     */
    OK = 0,

    /**
     * @brief 程序因信号崩溃或者返回值非 0
     * 编译时表示编译失败，评测时表示选手程序运行时错误。
     * 属于选手错误，不会被重试。
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief 程序运行时间超出限制
     * CPU 时间和时钟时间任意一个超出限制都会返回该结果。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 程序运行内存超限
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 评测系统出错
     * 比如沙箱无法创建、runguard 出错、对象存储读取失败、RPC 超时。
     * 属于基础设施错误，由 evaluation_service 负责重试。
     */
    SANDBOX_ERROR = 4
};

const char *get_display_message(status);

/**
 * @brief 从 get_display_message 的结果解析出状态
 * @throw std::invalid_argument 如果字符串不是合法的状态
 */
status parse_status(const std::string &name);

/**
 * @brief 是否是基础设施错误（需要重试，不计为选手的错误）
 */
bool is_infrastructure_failure(status);

void to_json(nlohmann::json &j, const status &s);
void from_json(const nlohmann::json &j, status &s);

}  // namespace grader

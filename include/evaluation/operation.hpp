#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>

namespace grader {

enum class operation_type {
    COMPILATION = 0,
    EVALUATION = 1
};

const char *get_display_message(operation_type);

/**
 * @brief 操作的指纹，除 enqueued_at 以外的所有字段
 * 同一个指纹在队列中和执行中的实例总数不超过 1
 */
typedef std::tuple<operation_type, std::string, std::string, std::string, int> fingerprint;

/**
 * @brief 一个评测单元：编译一个提交，或者评测一个数据点
 */
struct operation {
    operation_type type = operation_type::COMPILATION;

    std::string submission_id;

    std::string dataset_id;

    /**
     * @brief 数据点编号，只有评测操作有
     */
    std::string testcase_id;

    /**
     * @brief 优先级，数值越大越优先
     */
    int priority = 0;

    /**
     * @brief 入队时间，相同优先级的操作先入队的先执行
     */
    std::chrono::system_clock::time_point enqueued_at;

    grader::fingerprint fingerprint() const;

    /**
     * @brief 用于日志的简短描述
     */
    std::string to_string() const;

    static operation compilation(const std::string &submission_id, const std::string &dataset_id, int priority);
    static operation evaluation(const std::string &submission_id, const std::string &dataset_id, const std::string &testcase_id, int priority);
};

bool same_result(const operation &a, const std::string &submission_id, const std::string &dataset_id);

void to_json(nlohmann::json &j, const operation &op);
void from_json(const nlohmann::json &j, operation &op);

/**
 * @brief 时间点和 unix 时间戳（秒，允许小数）之间的转换
 */
double to_timestamp(const std::chrono::system_clock::time_point &time);
std::chrono::system_clock::time_point from_timestamp(double timestamp);

}  // namespace grader

#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "evaluation/outcome.hpp"

namespace grader {

/**
 * @brief 一个提交在一个数据集上的评测状态
 *
 * COMPILING -> COMPILATION_FAILED
 *           -> COMPILED -> EVALUATING -> EVALUATED -> SCORING -> SCORED
 *           -> CANNOT_COMPILE              -> CANNOT_EVALUATE
 *
 * CANNOT_COMPILE 和 CANNOT_EVALUATE 表示基础设施错误的重试次数耗尽，
 * 需要管理员处理，不能当作选手程序的错误计分。
 */
enum class result_state {
    COMPILING = 0,
    COMPILATION_FAILED = 1,
    COMPILED = 2,
    EVALUATING = 3,
    EVALUATED = 4,
    SCORING = 5,
    SCORED = 6,
    CANNOT_COMPILE = 7,
    CANNOT_EVALUATE = 8
};

const char *get_display_message(result_state);

void to_json(nlohmann::json &j, const result_state &state);
void from_json(const nlohmann::json &j, result_state &state);

struct submission_result {
    std::string submission_id;

    std::string dataset_id;

    result_state state = result_state::COMPILING;

    /**
     * @brief 已经完成的编译次数（包括基础设施错误的次数）
     */
    int compilation_tries = 0;

    /**
     * @brief 每个数据点已经完成的评测次数
     */
    std::map<std::string, int> evaluation_tries;

    /**
     * @brief 最后一次执行编译的 worker，-1 表示还没有编译
     */
    int compilation_shard = -1;

    /**
     * @brief 最后一次执行评测的 worker，-1 表示还没有评测
     */
    int evaluation_shard = -1;

    /**
     * @brief 最后一次编译的结果
     */
    outcome compilation;

    /**
     * @brief 数据点编号 -> 评测结果，只保存选手程序的最终结果
     */
    std::map<std::string, outcome> evaluations;

    double score = 0;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> compiled_at;
    std::optional<std::chrono::system_clock::time_point> evaluated_at;

    /**
     * @brief 第一次进入 SCORED 状态的时间，之后重新计分不会修改
     */
    std::optional<std::chrono::system_clock::time_point> scored_at;

    /**
     * @brief 状态转移
     * @throw internal_error 如果转移不合法
     */
    void transition(result_state next);

    /**
     * @brief 重新编译：清空编译和评测的所有结果，回到 COMPILING
     */
    void reset_compilation();

    /**
     * @brief 重新评测：清空评测结果，回到 EVALUATING
     * @return 提交没有编译成功时不做任何事，返回 false
     */
    bool reset_evaluation();

    /**
     * @brief 是否已经编译成功（可以评测）
     */
    bool compiled() const;

    /**
     * @brief 是否处于终态，不会再有新的操作
     */
    bool finished() const;
};

void to_json(nlohmann::json &j, const submission_result &result);
void from_json(const nlohmann::json &j, submission_result &result);

}  // namespace grader

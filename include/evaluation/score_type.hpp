#pragma once

#include <memory>
#include <string>
#include "evaluation/submission_result.hpp"
#include "evaluation/submission_store.hpp"

namespace grader {

/**
 * @brief 计分方式
 * 根据数据集和所有数据点的评测结果计算提交的分数
 */
struct score_type {
    virtual ~score_type();

    virtual std::string name() const = 0;

    /**
     * @brief 计算分数
     * @param ds 数据集
     * @param result 已经完成评测的结果，evaluations 包含所有数据点
     */
    virtual double compute(const dataset &ds, const submission_result &result) const = 0;
};

/**
 * @brief 每个数据点分数相同，总分为 100
 * 数据点评测结果为 OK 且输出和标准输出一致（如果有标准输出）时得分
 */
struct sum_score_type : public score_type {
    std::string name() const override;
    double compute(const dataset &ds, const submission_result &result) const override;
};

/**
 * @brief 根据名字构造计分方式
 * @throw std::invalid_argument 如果名字未知
 */
std::unique_ptr<score_type> make_score_type(const std::string &name);

}  // namespace grader

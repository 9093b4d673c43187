#pragma once

#include <gmock/gmock.h>
#include <memory>
#include <string>
#include "evaluation/submission_store.hpp"
#include "sandbox/sandbox.hpp"
#include "store/object_store.hpp"

/**
 * 测试用的评测环境
 * 用法：
 * 1. setup_test_environment();
 * 2. auto objects = make_memory_object_store();
 * 3. memory_store contest; prepare_contest(contest, *objects, 3);
 * 4. 提交 s1 需要在数据集 d1 上评测，数据点为 t1, t2, ...
 */
namespace grader {

void setup_test_environment();

std::unique_ptr<store::object_store> make_memory_object_store();

/**
 * @brief 准备一个用 /bin/sh 编写的比赛
 * 提交 s1 读入一个整数并输出它的两倍，数据点 ti 的输入为 i，答案为 2i
 * @param testcases 数据点个数
 */
void prepare_contest(memory_store &contest, store::object_store &objects, int testcases);

/**
 * @brief 构造一个沙箱执行结果
 * @param output_file 非空时附带一个生成的文件
 */
execution_result make_execution_result(status stat, const std::string &output_file = "", const std::string &content = "");

struct mock_sandbox : public sandbox {
    MOCK_METHOD(execution_result, run, (const execution &exec), (override));

protected:
    MOCK_METHOD(void, execute, (const std::filesystem::path &dir, const std::filesystem::path &box, const execution &exec, execution_result &result), (override));
};

}  // namespace grader

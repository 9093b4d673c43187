#pragma once

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "evaluation/submission_result.hpp"
#include "sandbox/sandbox.hpp"
#include "store/maintenance.hpp"

namespace grader {

struct testcase {
    std::string id;

    /**
     * @brief 输入数据的摘要
     */
    std::string input_digest;

    /**
     * @brief 标准输出的摘要，为空表示不比较输出
     */
    std::string output_digest;
};

/**
 * @brief 一个题目的一套数据和评测参数
 */
struct dataset {
    std::string id;

    std::string task;

    resource_limits limits;

    /**
     * @brief 题目提供的辅助文件（头文件、交互库、检查器等），文件名 -> 摘要
     */
    std::map<std::string, std::string> managers;

    std::vector<testcase> testcases;

    /**
     * @brief 计分方式，见 make_score_type
     */
    std::string score_type = "sum";

    /**
     * @brief 输入文件名，为空时从标准输入读取
     */
    std::string input_file;

    /**
     * @brief 输出文件名，为空时收集标准输出
     */
    std::string output_file;
};

/**
 * @brief 编程语言的编译和运行命令
 */
struct language {
    std::string name;

    /**
     * @brief 编译命令，在包含提交文件和辅助文件的私有目录中执行
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令，在包含可执行文件和输入数据的私有目录中执行
     */
    std::vector<std::string> run_command;

    /**
     * @brief 编译产生的可执行文件名
     */
    std::string executable = "program";

    /**
     * @brief 编译的资源限制
     */
    resource_limits compile_limits{10, 20, 512 << 20};
};

struct submission {
    std::string id;

    std::string task;

    std::string language;

    /**
     * @brief 选手提交的文件，文件名 -> 摘要
     */
    std::map<std::string, std::string> files;
};

void from_json(const nlohmann::json &j, testcase &tc);
void from_json(const nlohmann::json &j, dataset &ds);
void from_json(const nlohmann::json &j, language &lang);
void from_json(const nlohmann::json &j, submission &submit);

/**
 * @brief 提交和评测结果的持久化存储
 * 数据库等持久化层实现这个接口，evaluation_service 只通过这里读取提交信息、保存评测状态。
 * 同时作为垃圾回收的引用来源，枚举所有实体引用的对象。
 * 实现必须是线程安全的。
 */
struct submission_store : public store::reference_source {
    virtual std::optional<submission> find_submission(const std::string &submission_id) = 0;

    virtual std::optional<dataset> find_dataset(const std::string &dataset_id) = 0;

    virtual std::optional<language> find_language(const std::string &name) = 0;

    /**
     * @brief 需要评测这个提交的数据集
     */
    virtual std::vector<std::string> datasets_to_judge(const submission &submit) = 0;

    virtual std::vector<std::string> list_submissions() = 0;

    virtual std::optional<submission_result> load_result(const std::string &submission_id, const std::string &dataset_id) = 0;

    /**
     * @brief 保存评测状态
     */
    virtual void save(const submission_result &result) = 0;

    virtual std::vector<submission_result> list_results() = 0;
};

/**
 * @brief 保存在内存中的提交存储，可以从比赛 JSON 文件中加载
 * @code{.json}
 * {
 *     "languages": [{"name": "C++17", "compile": ["/usr/bin/g++", "-O2", "-o", "program", "main.cpp"], "run": ["./program"]}],
 *     "datasets": [{"id": "1", "task": "aplusb", "limits": {"cpu_time": 1, "wall_time": 3, "memory": 268435456},
 *                   "testcases": [{"id": "001", "input": "<digest>", "output": "<digest>"}]}],
 *     "submissions": [{"id": "42", "task": "aplusb", "language": "C++17", "files": {"main.cpp": "<digest>"}}]
 * }
 * @endcode
 */
struct memory_store : public submission_store {
    void load(const nlohmann::json &contest);

    void add_language(const language &lang);
    void add_dataset(const dataset &ds);
    void add_submission(const submission &submit);

    std::optional<submission> find_submission(const std::string &submission_id) override;
    std::optional<dataset> find_dataset(const std::string &dataset_id) override;
    std::optional<language> find_language(const std::string &name) override;
    std::vector<std::string> datasets_to_judge(const submission &submit) override;
    std::vector<std::string> list_submissions() override;
    std::optional<submission_result> load_result(const std::string &submission_id, const std::string &dataset_id) override;
    void save(const submission_result &result) override;
    std::vector<submission_result> list_results() override;

    std::string name() const override;
    void enumerate(std::set<std::string> &digests) override;

private:
    std::mutex mut;
    std::map<std::string, language> languages;
    std::map<std::string, dataset> datasets;
    std::map<std::string, submission> submissions;
    std::map<std::pair<std::string, std::string>, submission_result> results;
};

}  // namespace grader

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief evaluation_service 发送给 worker 的执行描述
 * 文件只以摘要的形式出现，worker 自己从对象存储中获取
 */
struct job {
    std::vector<std::string> command;

    /**
     * @brief 文件名 -> 摘要
     */
    std::map<std::string, std::string> files;

    std::set<std::string> executables;

    /**
     * @brief 作为标准输入的文件名，必须在 files 中
     */
    std::string stdin_file;

    /**
     * @brief 需要收集的文件名
     * 编译操作为可执行文件名，评测操作为输出文件名（为空时收集标准输出）
     */
    std::string output_file;

    resource_limits limits;
};

void to_json(nlohmann::json &j, const resource_limits &limits);
void from_json(const nlohmann::json &j, resource_limits &limits);

void to_json(nlohmann::json &j, const job &jb);
void from_json(const nlohmann::json &j, job &jb);

}  // namespace grader

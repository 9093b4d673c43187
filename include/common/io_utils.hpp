#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(二进制安全)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的前 limit 个字节
 * @param truncated 文件超出 limit 时置为 true
 */
std::string read_file_content(const std::filesystem::path &path, size_t limit, bool &truncated);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于沙箱目录的文件名
 * 来自题目配置和选手提交，如果拿到的文件名包含 ".." 或者是绝对路径，
 * 那么最后有可能导致沙箱外的文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 读取文件的修改时间
 */
time_t last_write_time(const std::filesystem::path &path);

}  // namespace grader

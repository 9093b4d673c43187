#pragma once

#include <string>

namespace grader::store {

/**
 * @brief 计算内容的 SHA-1 摘要
 * @return 40 位小写十六进制字符串，作为对象存储中的键
 */
std::string compute_digest(const std::string &content);

/**
 * @brief 检查字符串是否是合法的摘要（40 位小写十六进制）
 * 用于拒绝来自 RPC 参数的非法文件名
 */
bool is_valid_digest(const std::string &digest);

}  // namespace grader::store

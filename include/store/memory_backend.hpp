#pragma once

#include <map>
#include <mutex>
#include "store/backend.hpp"

namespace grader::store {

/**
 * @brief 保存在内存中的后端，用于单进程部署和测试
 */
struct memory_backend : public backend {
    bool put(const std::string &digest, const std::string &content) override;
    std::string get(const std::string &digest) override;
    bool contains(const std::string &digest) override;
    bool remove(const std::string &digest) override;
    std::vector<object_info> list() override;

    /**
     * @brief 直接覆盖对象内容，不经过任何校验
     * 用于模拟存储介质损坏
     */
    void overwrite(const std::string &digest, const std::string &content);

private:
    std::mutex mut;
    std::map<std::string, std::pair<std::string, time_t>> objects;
};

}  // namespace grader::store

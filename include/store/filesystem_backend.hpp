#pragma once

#include <filesystem>
#include "store/backend.hpp"

namespace grader::store {

/**
 * @brief 将每个对象保存为 root 下以摘要命名的文件
 * 写入时先写临时文件再重命名，因此其他进程不会读到写了一半的对象。
 */
struct filesystem_backend : public backend {
    explicit filesystem_backend(const std::filesystem::path &root);

    bool put(const std::string &digest, const std::string &content) override;
    std::string get(const std::string &digest) override;
    bool contains(const std::string &digest) override;
    bool remove(const std::string &digest) override;
    std::vector<object_info> list() override;

    std::filesystem::path path_of(const std::string &digest) const;

private:
    std::filesystem::path root;
};

}  // namespace grader::store

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "store/backend.hpp"

namespace grader::store {

/**
 * @brief 内容寻址的对象存储
 * 对象的键是内容的 SHA-1 摘要，因此相同的内容只会保存一份。
 * 可以在持久化后端前面加一层本地缓存，对调用者透明：
 * 缓存未命中时会从持久化后端读取并写回缓存。
 */
struct object_store {
    /**
     * @param durable 持久化后端
     * @param cache 本地缓存，可以为空
     */
    explicit object_store(std::unique_ptr<backend> durable, std::unique_ptr<backend> cache = nullptr);

    /**
     * @brief 保存内容
     * @return 内容的摘要，相同的内容总是得到相同的摘要
     */
    std::string put(const std::string &content);

    /**
     * @brief 读取内容，返回前会校验摘要
     * @throw corrupted_object_error 如果内容和摘要不一致
     * @throw store_error 如果对象不存在
     */
    std::string get(const std::string &digest);

    /**
     * @brief 读取内容并写入文件
     */
    void get_to_file(const std::string &digest, const std::filesystem::path &path);

    bool contains(const std::string &digest);

    /**
     * @brief 持久化后端中的对象数量
     */
    size_t size();

    /**
     * @brief 从缓存和持久化后端中删除对象
     */
    bool remove(const std::string &digest);

    /**
     * @brief 只从缓存中删除对象，下次读取时会从持久化后端重新获取
     */
    bool remove_from_cache(const std::string &digest);

    /**
     * @brief 预先将对象读入缓存
     * 没有缓存层时只检查对象是否存在且完整
     * @throw store_error 如果对象不存在或者已损坏
     */
    void precache(const std::string &digest);

    backend &durable_backend();

private:
    std::unique_ptr<backend> durable;
    std::unique_ptr<backend> cache;

    std::string fetch(const std::string &digest);
};

}  // namespace grader::store

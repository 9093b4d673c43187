#pragma once

#include <ctime>
#include <string>
#include <vector>

namespace grader::store {

/**
 * @brief 后端中一个对象的元信息
 */
struct object_info {
    std::string digest;
    size_t size = 0;

    /**
     * @brief 对象写入后端的时间，垃圾回收据此跳过刚写入的对象
     */
    time_t stored_at = 0;
};

/**
 * @brief 对象存储后端，按摘要存取不可变的字节序列
 * 后端不校验内容和摘要是否一致，校验由 object_store 完成。
 * 实现必须是线程安全的。
 */
struct backend {
    virtual ~backend();

    /**
     * @brief 写入对象
     * 如果对象已经存在，不会重复写入
     * @return 对象是否是新写入的
     */
    virtual bool put(const std::string &digest, const std::string &content) = 0;

    /**
     * @brief 读取对象内容
     * @throw store_error 如果对象不存在或者无法读取
     */
    virtual std::string get(const std::string &digest) = 0;

    virtual bool contains(const std::string &digest) = 0;

    /**
     * @brief 删除对象
     * @return 对象是否存在
     */
    virtual bool remove(const std::string &digest) = 0;

    /**
     * @brief 列出后端中的所有对象
     */
    virtual std::vector<object_info> list() = 0;
};

}  // namespace grader::store

#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>
#include "store/backend.hpp"

namespace grader::store {

/**
 * @brief 引用了对象的实体集合
 * 每一类实体（提交的源代码、可执行文件、评测输出等）实现这个接口，
 * 垃圾回收只通过这个接口得知哪些对象仍然被引用，不关心实体的具体类型。
 */
struct reference_source {
    virtual ~reference_source();

    /**
     * @brief 实体集合的名字，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 将所有仍被引用的摘要加入 digests
     */
    virtual void enumerate(std::set<std::string> &digests) = 0;
};

struct gc_options {
    /**
     * @brief 为真时只统计，不删除
     */
    bool dry_run = false;

    /**
     * @brief 比快照时间晚 min_age 以内写入的对象不会被删除
     * 避免删除刚上传、引用还没有写入数据库的对象
     */
    std::chrono::seconds min_age{3600};
};

struct gc_report {
    size_t scanned = 0;
    size_t orphans = 0;
    size_t deleted = 0;
    size_t bytes = 0;
};

/**
 * @brief 删除没有被任何实体引用的对象
 * 先对后端中的对象做快照，再枚举引用，因此扫描过程中写入的对象
 * 不在快照内，不会被删除。
 * @param sources 所有引用了对象的实体集合
 */
gc_report collect_garbage(backend &objects, const std::vector<reference_source *> &sources, const gc_options &options);

/**
 * @brief 重新计算每个对象的摘要并和键比较
 * @param remove 为真时删除不一致的对象
 * @return 不一致的对象的键
 */
std::vector<std::string> verify_objects(backend &objects, bool remove);

}  // namespace grader::store

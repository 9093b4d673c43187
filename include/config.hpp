#pragma once

#include <cstddef>
#include <filesystem>

namespace grader {

/**
 * @brief 对象存储的持久化目录
 * 每个对象以其 SHA-1 摘要（40 位小写十六进制）为文件名存放：
 *
 * STORE_DIR
 * ├── 3da541559918a808c2402bba5012f6c60b27661c
 * ├── a9993e364706816aba3e25717850c26c9cd0d89d
 * └── ...
 */
extern std::filesystem::path STORE_DIR;

/**
 * @brief 对象存储的本地缓存目录，布局和 STORE_DIR 相同
 * 为空时不启用缓存层。worker 通常将缓存目录放在本机磁盘，
 * 而 STORE_DIR 放在共享存储上。
 */
extern std::filesystem::path CACHE_DIR;

/**
 * @brief 沙箱私有工作目录的根目录
 * 每次沙箱执行都会创建一个新的子目录，执行结束后删除：
 *
 * RUN_DIR
 * ├── sandbox-8e2f...  // 随机生成的 uuid
 * │   ├── source.cpp   // 预置的输入文件
 * │   ├── .stdout      // 被执行程序的标准输出
 * │   ├── .stderr      // 被执行程序的标准错误
 * │   └── .meta        // runguard 的运行信息
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 标准输出和标准错误最多保留的字节数
 */
extern size_t MAX_OUTPUT_BYTES;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，沙箱执行完成后不会删除私有工作目录，
 * 以便手动检查产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace grader

#pragma once

#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令
 * @param cwd 子进程的工作目录，为空时继承当前进程的工作目录
 * @param env 额外的环境变量
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
int exec_program(const std::filesystem::path &cwd, const std::map<std::string, std::string> &env, const char **argv);

/**
 * @brief 在指定目录下调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     std::filesystem::path shell("/bin/sh");
 *     // 相当于在 /tmp 下执行 system("/bin/sh -c true");
 *     int exitcode = call_process_in("/tmp", shell, "-c", "true");
 * @endcode
 */
template <typename... Args>
int call_process_in(const std::filesystem::path &cwd, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv(list.size() + 1, nullptr);
    for (size_t i = 0; i < list.size(); ++i)
        argv[i] = list[i].data();

#ifndef NDEBUG
    std::stringstream ss;
    for (size_t i = 0; i < list.size(); ++i)
        ss << argv[i] << ' ';
    DLOG(INFO) << ss.str();
#endif

    return exec_program(cwd, {}, argv.data());
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 生成随机的 uuid 字符串，用于请求 id 和沙箱目录名
 */
std::string random_id();

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

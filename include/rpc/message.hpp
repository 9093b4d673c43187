#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader::rpc {

/**
 * @brief 响应的状态
 * ok、wait、fail 由被调用方给出，timeout、cancelled 和 unreachable 只由调用方在本地产生
 * unreachable 表示无法与被调用方通信，比如连接被拒绝或者在等待结果时连接断开
 */
namespace response_status {
constexpr const char *OK = "ok";
constexpr const char *WAIT = "wait";
constexpr const char *FAIL = "fail";
constexpr const char *TIMEOUT = "timeout";
constexpr const char *CANCELLED = "cancelled";
constexpr const char *UNREACHABLE = "unreachable";
}  // namespace response_status

/**
 * @brief 一次远程调用的请求
 */
struct request {
    /**
     * @brief 调用方生成的请求 id，轮询时用这个 id 查询结果
     */
    std::string id;

    /**
     * @brief 服务名，比如 Worker 和 EvaluationService
     */
    std::string service;

    /**
     * @brief 服务的分片编号，对于 Worker 就是 worker 的编号
     */
    int shard = 0;

    std::string method;

    /**
     * @brief 命名参数
     */
    nlohmann::json arguments = nlohmann::json::object();
};

struct response {
    std::string status;

    /**
     * @brief ok 时为返回值，fail 时为 {"error": 错误信息}
     */
    nlohmann::json data;

    bool is_ok() const;
    bool is_pending() const;

    /**
     * @brief 失败时的错误信息
     */
    std::string error() const;

    static response ok(const nlohmann::json &data);
    static response wait();
    static response fail(const std::string &message);
    static response timeout();
    static response cancelled();
    static response unreachable(const std::string &message);
};

void to_json(nlohmann::json &j, const request &req);
void from_json(const nlohmann::json &j, request &req);
void to_json(nlohmann::json &j, const response &resp);
void from_json(const nlohmann::json &j, response &resp);

}  // namespace grader::rpc

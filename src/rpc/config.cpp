#include "rpc/config.hpp"
#include "common/json_utils.hpp"

namespace grader::rpc {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("hostname").get_to(mq.hostname);
    j.at("port").get_to(mq.port);
    mq.username = get_value_def<string>(j, "guest", "username");
    mq.password = get_value_def<string>(j, "guest", "password");
    mq.exchange = get_value_def<string>(j, "grader.rpc", "exchange");
    mq.exchange_type = get_value_def<string>(j, "direct", "exchange_type");
}

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    j.at("port").get_to(redis_config.port);
    redis_config.retry_interval = get_value_def<unsigned>(j, 1000, "retry_interval");
    redis_config.password = get_value_def<string>(j, "", "password");
    redis_config.result_ttl = get_value_def<int>(j, 3600, "result_ttl");
}

}  // namespace grader::rpc

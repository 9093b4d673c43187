#include "rpc/message.hpp"
#include "common/json_utils.hpp"

namespace grader::rpc {
using namespace std;
using namespace nlohmann;

bool response::is_ok() const {
    return status == response_status::OK;
}

bool response::is_pending() const {
    return status == response_status::WAIT;
}

string response::error() const {
    if (is_ok()) return "";
    return get_value_def<string>(data, status, "error");
}

response response::ok(const json &data) {
    return {response_status::OK, data};
}

response response::wait() {
    return {response_status::WAIT, nullptr};
}

response response::fail(const string &message) {
    return {response_status::FAIL, {{"error", message}}};
}

response response::timeout() {
    return {response_status::TIMEOUT, {{"error", "request timed out"}}};
}

response response::cancelled() {
    return {response_status::CANCELLED, {{"error", "request cancelled"}}};
}

response response::unreachable(const string &message) {
    return {response_status::UNREACHABLE, {{"error", message}}};
}

void to_json(json &j, const request &req) {
    j = {{"id", req.id},
         {"service", req.service},
         {"shard", req.shard},
         {"method", req.method},
         {"arguments", req.arguments}};
}

void from_json(const json &j, request &req) {
    j.at("id").get_to(req.id);
    j.at("service").get_to(req.service);
    j.at("shard").get_to(req.shard);
    j.at("method").get_to(req.method);
    req.arguments = access_optional(j, "arguments");
    if (req.arguments.is_null()) req.arguments = json::object();
}

void to_json(json &j, const response &resp) {
    j = {{"status", resp.status}, {"data", resp.data}};
}

void from_json(const json &j, response &resp) {
    j.at("status").get_to(resp.status);
    resp.data = access_optional(j, "data");
}

}  // namespace grader::rpc

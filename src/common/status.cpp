#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::OK, "OK")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED")
    (status::SANDBOX_ERROR, "SANDBOX_ERROR");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, str] : status_string)
        if (name == str) return stat;
    throw invalid_argument("unknown status " + name);
}

bool is_infrastructure_failure(status stat) {
    return stat == status::SANDBOX_ERROR;
}

void to_json(nlohmann::json &j, const status &s) {
    j = get_display_message(s);
}

void from_json(const nlohmann::json &j, status &s) {
    s = parse_status(j.get<string>());
}

}  // namespace grader

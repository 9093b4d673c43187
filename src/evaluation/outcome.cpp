#include "evaluation/outcome.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

outcome outcome::infrastructure_failure(const string &message) {
    outcome o;
    o.stat = status::SANDBOX_ERROR;
    o.message = message;
    return o;
}

void to_json(json &j, const outcome &o) {
    j = {{"status", o.stat},
         {"stdout_digest", o.stdout_digest},
         {"stderr_digest", o.stderr_digest},
         {"time_used", o.time_used},
         {"wall_time", o.wall_time},
         {"memory_used", o.memory_used},
         {"output_digest", o.output_digest},
         {"executable_digest", o.executable_digest},
         {"exitcode", o.exitcode},
         {"signal", o.signal},
         {"message", o.message}};
}

void from_json(const json &j, outcome &o) {
    j.at("status").get_to(o.stat);
    o.stdout_digest = get_value_def<string>(j, "", "stdout_digest");
    o.stderr_digest = get_value_def<string>(j, "", "stderr_digest");
    o.time_used = get_value_def<double>(j, 0, "time_used");
    o.wall_time = get_value_def<double>(j, 0, "wall_time");
    o.memory_used = get_value_def<size_t>(j, 0, "memory_used");
    o.output_digest = get_value_def<string>(j, "", "output_digest");
    o.executable_digest = get_value_def<string>(j, "", "executable_digest");
    o.exitcode = get_value_def<int>(j, -1, "exitcode");
    o.signal = get_value_def<int>(j, -1, "signal");
    o.message = get_value_def<string>(j, "", "message");
}

}  // namespace grader

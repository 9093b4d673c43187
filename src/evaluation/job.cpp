#include "evaluation/job.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const resource_limits &limits) {
    j = {{"cpu_time", limits.cpu_time},
         {"wall_time", limits.wall_time},
         {"memory", limits.memory}};
}

void from_json(const json &j, resource_limits &limits) {
    limits.cpu_time = get_value_def<double>(j, 0, "cpu_time");
    limits.wall_time = get_value_def<double>(j, 0, "wall_time");
    limits.memory = get_value_def<size_t>(j, 0, "memory");
}

void to_json(json &j, const job &jb) {
    j = {{"command", jb.command},
         {"files", jb.files},
         {"executables", jb.executables},
         {"stdin_file", jb.stdin_file},
         {"output_file", jb.output_file},
         {"limits", jb.limits}};
}

void from_json(const json &j, job &jb) {
    j.at("command").get_to(jb.command);
    jb.files = get_value_def<map<string, string>>(j, {}, "files");
    jb.executables = get_value_def<set<string>>(j, {}, "executables");
    jb.stdin_file = get_value_def<string>(j, "", "stdin_file");
    jb.output_file = get_value_def<string>(j, "", "output_file");
    if (j.count("limits")) j.at("limits").get_to(jb.limits);
}

}  // namespace grader

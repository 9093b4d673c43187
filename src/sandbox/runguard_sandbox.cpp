#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>
#include <cmath>
#include <fstream>
#include <map>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/runguard.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static map<string, string> read_metadata(const fs::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) continue;
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        LOG(WARNING) << "Malformed runguard meta field " << key << ": " << it->second;
    }
}

runguard_result read_runguard_result(const fs::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    if (metadata.count("time-result")) result.time_result = metadata.at("time-result");
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    return result;
}

runguard_sandbox::runguard_sandbox(const fs::path &runguard, const vector<string> &extra_args)
    : runguard(runguard), extra_args(extra_args) {}

void runguard_sandbox::execute(const fs::path &dir, const fs::path &box, const execution &exec, execution_result &result) {
    fs::path metafile = dir / ".meta";

    vector<string> args = extra_args;
    if (exec.limits.cpu_time > 0) args.push_back("--cpu-time=" + boost::lexical_cast<string>(exec.limits.cpu_time));
    if (exec.limits.wall_time > 0) args.push_back("--wall-time=" + boost::lexical_cast<string>(exec.limits.wall_time));
    if (exec.limits.memory > 0) args.push_back("--memory-limit=" + to_string((exec.limits.memory + 1023) / 1024));
    if (!exec.stdin_file.empty()) args.push_back("--standard-input-file=" + (box / exec.stdin_file).string());
    args.push_back("--standard-output-file=" + (dir / ".stdout").string());
    args.push_back("--standard-error-file=" + (dir / ".stderr").string());
    args.push_back("--stream-size=" + to_string((MAX_OUTPUT_BYTES + 1023) / 1024));
    args.push_back("--no-core-dumps");
    args.push_back("--out-meta=" + metafile.string());
    args.push_back("--");

    int ret = call_process_in(box, runguard, args, exec.command);

    if (!fs::exists(metafile))
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("runguard exited with {} without writing meta file", ret)));

    auto meta = read_runguard_result(metafile);
    if (!meta.internal_error.empty())
        BOOST_THROW_EXCEPTION(internal_error("runguard internal error: " + meta.internal_error));

    result.exitcode = meta.exitcode;
    result.signal = meta.signal;
    result.time_used = max(meta.cpu_time, 0.0);
    result.wall_time = max(meta.wall_time, 0.0);
    result.memory_used = meta.memory > 0 ? (size_t)meta.memory : 0;

    if (!meta.time_result.empty())
        result.stat = status::TIME_LIMIT_EXCEEDED;
    // cgroup 因内存不足杀死进程时，记录的内存恰好等于限制
    else if (exec.limits.memory > 0 && result.memory_used >= exec.limits.memory)
        result.stat = status::MEMORY_LIMIT_EXCEEDED;
    else if (result.signal > 0 || result.exitcode != 0)
        result.stat = status::RUNTIME_ERROR;
    else
        result.stat = status::OK;
}

}  // namespace grader

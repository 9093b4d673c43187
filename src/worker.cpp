#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

worker::worker(int shard, store::object_store &objects, sandbox &box, size_t concurrency)
    : worker_shard(shard), objects(objects), box(box), concurrency(concurrency) {}

int worker::shard() const {
    return worker_shard;
}

size_t worker::running() const {
    return running_operations;
}

outcome worker::execute_operation(const operation &op, unsigned long long attempt, const job &j) {
    if (++running_operations > concurrency) {
        --running_operations;
        BOOST_THROW_EXCEPTION(grader_exception("worker " + to_string(worker_shard) + " is busy"));
    }
    defer { --running_operations; };

    DLOG(INFO) << "Worker " << worker_shard << " executing " << op.to_string() << " (attempt " << attempt << ")";

    execution exec;
    exec.command = j.command;
    exec.executables = j.executables;
    exec.stdin_file = j.stdin_file;
    exec.limits = j.limits;
    if (!j.output_file.empty()) exec.output_files.push_back(j.output_file);

    try {
        for (auto &[name, digest] : j.files)
            exec.input_files[name] = objects.get(digest);
    } catch (store_error &ex) {
        LOG(WARNING) << "Worker " << worker_shard << " unable to fetch files of " << op.to_string() << ": " << ex.what();
        return outcome::infrastructure_failure(string("unable to fetch files: ") + ex.what());
    }

    execution_result res = box.run(exec);

    outcome o;
    o.stat = res.stat;
    o.exitcode = res.exitcode;
    o.signal = res.signal;
    o.time_used = res.time_used;
    o.wall_time = res.wall_time;
    o.memory_used = res.memory_used;
    o.message = res.message;
    if (is_infrastructure_failure(o.stat)) return o;

    try {
        o.stdout_digest = objects.put(res.stdout_data);
        o.stderr_digest = objects.put(res.stderr_data);

        string produced;
        if (!j.output_file.empty() && res.output_files.count(j.output_file))
            produced = objects.put(res.output_files.at(j.output_file));

        if (op.type == operation_type::COMPILATION)
            o.executable_digest = produced;
        else  // 没有指定输出文件时以标准输出作为答案
            o.output_digest = j.output_file.empty() ? o.stdout_digest : produced;
    } catch (store_error &ex) {
        return outcome::infrastructure_failure(string("unable to store results: ") + ex.what());
    }

    // 编译器正常退出却没有生成可执行文件，视为编译失败
    if (op.type == operation_type::COMPILATION && o.stat == status::OK && o.executable_digest.empty()) {
        o.stat = status::RUNTIME_ERROR;
        o.message = "compiler did not produce " + j.output_file;
    }
    return o;
}

size_t worker::precache_files(const vector<string> &digests) {
    size_t cached = 0;
    for (auto &digest : digests) {
        try {
            objects.precache(digest);
            ++cached;
        } catch (store_error &ex) {
            LOG(WARNING) << "Worker " << worker_shard << " unable to precache " << digest << ": " << ex.what();
        }
    }
    return cached;
}

rpc::service &worker::rpc_service() {
    if (svc) return *svc;

    svc = make_unique<rpc::service>("Worker");
    svc->bind("execute_operation", [this](const json &args) {
        auto op = get_value<operation>(args, "operation");
        auto attempt = get_value<unsigned long long>(args, "attempt");
        auto j = get_value<job>(args, "job");
        return json(execute_operation(op, attempt, j));
    });
    svc->bind("ping", [this](const json &) {
        return json{{"shard", worker_shard}, {"running", running()}};
    });
    svc->bind("precache_files", [this](const json &args) {
        return json{{"cached", precache_files(get_value<vector<string>>(args, "digests"))}};
    });
    return *svc;
}

}  // namespace grader

#include "evaluation/evaluation_service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/core.h>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "evaluation/score_type.hpp"
#include "store/maintenance.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static const char *WORKER_SERVICE = "Worker";

// 评测时标准输入在沙箱中的文件名
static const char *STDIN_FILE = ".input";

static chrono::milliseconds seconds_of(const json &j, const char *key, chrono::milliseconds def) {
    double seconds = get_value_def<double>(j, def.count() / 1000.0, key);
    return chrono::milliseconds((long long)(seconds * 1000));
}

void from_json(const json &j, worker_config &config) {
    j.at("shard").get_to(config.shard);
    config.capacity = get_value_def<size_t>(j, 1, "capacity");
}

void from_json(const json &j, evaluation_config &config) {
    config.max_compilation_tries = get_value_def<int>(j, config.max_compilation_tries, "max_compilation_tries");
    config.max_evaluation_tries = get_value_def<int>(j, config.max_evaluation_tries, "max_evaluation_tries");
    config.compilation_priority = get_value_def<int>(j, config.compilation_priority, "compilation_priority");
    config.evaluation_priority = get_value_def<int>(j, config.evaluation_priority, "evaluation_priority");
    config.worker_timeout = seconds_of(j, "worker_timeout", config.worker_timeout);
    config.heartbeat_timeout = seconds_of(j, "heartbeat_timeout", config.heartbeat_timeout);
    config.connection_check_interval = seconds_of(j, "connection_check_interval", config.connection_check_interval);
    config.jobs_not_done_interval = seconds_of(j, "jobs_not_done_interval", config.jobs_not_done_interval);
    config.gc_interval = chrono::seconds(get_value_def<long long>(j, config.gc_interval.count(), "gc_interval"));
    config.workers = get_value_def<vector<worker_config>>(j, {}, "workers");
}

evaluation_service::evaluation_service(const evaluation_config &config, submission_store &submissions, rpc::client &client,
                                       store::object_store *objects)
    : config(config), submissions(submissions), client(client), objects(objects) {
    for (auto &worker : config.workers)
        pool.add_worker(worker.shard, worker.capacity);
}

evaluation_service::~evaluation_service() {
    stop();
}

void evaluation_service::register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void evaluation_service::call_monitor(const function<void(monitor &)> &callback) {
    try {
        for (auto &m : monitors) callback(*m);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Evaluation service has crashed when reporting monitoring information, " << ex.what();
    }
}

void evaluation_service::report_error(const string &message) {
    call_monitor([&](monitor &m) { m.report_error(message); });
}

void evaluation_service::start() {
    {
        scoped_lock guard(mut);
        if (started) return;
        started = true;
        stopping = false;
    }

    check_connections();
    size_t count = search_jobs_not_done();
    LOG(INFO) << "Evaluation service started, " << count << " operations recovered";

    vector<int> shards;
    {
        scoped_lock guard(mut);
        shards = pool.shards();
    }
    for (int shard : shards)
        dispatchers.emplace_back([this, shard] { dispatch_loop(shard); });
    housekeeper = thread([this] { housekeeping_loop(); });
}

void evaluation_service::stop() {
    {
        scoped_lock guard(mut);
        stopping = true;
    }
    cond.notify_all();
    {
        scoped_lock guard(stop_mut);
        stop_cond.notify_all();
    }

    for (auto &th : dispatchers)
        if (th.joinable()) th.join();
    dispatchers.clear();
    if (housekeeper.joinable()) housekeeper.join();

    // 轮询线程会回调 operation_finished，必须等待所有回调结束才能析构
    unique_lock lock(mut);
    for (int shard : pool.shards())
        for (auto &entry : pool.at(shard).operations)
            entry.token->cancel();
    cond.wait(lock, [&] { return outstanding_calls == 0; });
    started = false;
}

submission_result &evaluation_service::load(const string &submission_id, const string &dataset_id) {
    auto key = make_pair(submission_id, dataset_id);
    auto it = results.find(key);
    if (it != results.end()) return it->second;

    auto stored = submissions.load_result(submission_id, dataset_id);
    if (stored) return results[key] = *stored;

    submission_result result;
    result.submission_id = submission_id;
    result.dataset_id = dataset_id;
    result.created_at = chrono::system_clock::now();
    return results[key] = result;
}

void evaluation_service::save(const submission_result &result) {
    submissions.save(result);
}

void evaluation_service::transition(submission_result &result, result_state next) {
    result.transition(next);
    call_monitor([&](monitor &m) { m.result_state_changed(result); });
}

bool evaluation_service::enqueue(const operation &op) {
    if (pool.in_flight(op.fingerprint())) return false;
    if (!queue.enqueue(op)) return false;
    cond.notify_all();
    return true;
}

size_t evaluation_service::admit(submission_result &result) {
    size_t count = 0;
    switch (result.state) {
        case result_state::COMPILING:
            if (result.compilation_tries < config.max_compilation_tries) {
                count += enqueue(operation::compilation(result.submission_id, result.dataset_id, config.compilation_priority));
            } else {
                abandon(result, operation_type::COMPILATION);
            }
            break;
        case result_state::COMPILED:
            transition(result, result_state::EVALUATING);
            [[fallthrough]];
        case result_state::EVALUATING: {
            auto ds = submissions.find_dataset(result.dataset_id);
            if (!ds) {
                report_error("Dataset " + result.dataset_id + " of submission " + result.submission_id + " does not exist");
                break;
            }
            bool done = true;
            for (auto &tc : ds->testcases) {
                if (result.evaluations.count(tc.id)) continue;
                done = false;
                if (result.evaluation_tries[tc.id] >= config.max_evaluation_tries) {
                    abandon(result, operation_type::EVALUATION);
                    return 0;
                }
                count += enqueue(operation::evaluation(result.submission_id, result.dataset_id, tc.id, config.evaluation_priority));
            }
            if (done) {
                transition(result, result_state::EVALUATED);
                score(result);
            }
            break;
        }
        case result_state::EVALUATED:
        case result_state::SCORING:
            score(result);
            break;
        default:
            break;
    }
    return count;
}

void evaluation_service::abandon(submission_result &result, operation_type type) {
    auto pred = [&](const operation &op) {
        return op.type == type && same_result(op, result.submission_id, result.dataset_id);
    };
    queue.remove_if(pred);
    pool.mark_stale(pred);

    if (type == operation_type::COMPILATION) {
        transition(result, result_state::CANNOT_COMPILE);
        report_error(fmt::format("Submission {} on dataset {} cannot be compiled after {} tries", result.submission_id,
                                 result.dataset_id, result.compilation_tries));
    } else {
        transition(result, result_state::CANNOT_EVALUATE);
        report_error(fmt::format("Submission {} on dataset {} cannot be evaluated", result.submission_id, result.dataset_id));
    }
}

void evaluation_service::score(submission_result &result) {
    auto ds = submissions.find_dataset(result.dataset_id);
    if (!ds) {
        report_error("Dataset " + result.dataset_id + " of submission " + result.submission_id + " does not exist");
        return;
    }

    if (result.state == result_state::EVALUATED) transition(result, result_state::SCORING);
    try {
        result.score = make_score_type(ds->score_type)->compute(*ds, result);
    } catch (std::exception &ex) {
        // 停留在 SCORING 状态，下次扫描未完成提交时会重新计分
        report_error(fmt::format("Unable to score submission {} on dataset {}: {}", result.submission_id, result.dataset_id, ex.what()));
        return;
    }
    transition(result, result_state::SCORED);
}

job evaluation_service::build_job(const operation &op) {
    auto submit = submissions.find_submission(op.submission_id);
    if (!submit) throw invalid_argument("submission " + op.submission_id + " does not exist");
    auto ds = submissions.find_dataset(op.dataset_id);
    if (!ds) throw invalid_argument("dataset " + op.dataset_id + " does not exist");
    auto lang = submissions.find_language(submit->language);
    if (!lang) throw invalid_argument("language " + submit->language + " does not exist");

    job j;
    if (op.type == operation_type::COMPILATION) {
        j.command = lang->compile_command;
        j.files = submit->files;
        // 题目提供的文件优先于选手上传的同名文件
        for (auto &[name, digest] : ds->managers) j.files[name] = digest;
        j.output_file = lang->executable;
        j.limits = lang->compile_limits;
        return j;
    }

    auto &result = load(op.submission_id, op.dataset_id);
    if (result.compilation.executable_digest.empty())
        throw invalid_argument("submission " + op.submission_id + " has no executable");

    const testcase *tc = nullptr;
    for (auto &t : ds->testcases)
        if (t.id == op.testcase_id) tc = &t;
    if (!tc) throw invalid_argument("testcase " + op.testcase_id + " does not exist in dataset " + op.dataset_id);

    j.command = lang->run_command;
    for (auto &[name, digest] : ds->managers) j.files[name] = digest;
    j.files[lang->executable] = result.compilation.executable_digest;
    j.executables.insert(lang->executable);
    if (ds->input_file.empty()) {
        j.files[STDIN_FILE] = tc->input_digest;
        j.stdin_file = STDIN_FILE;
    } else {
        j.files[ds->input_file] = tc->input_digest;
    }
    j.output_file = ds->output_file;
    j.limits = ds->limits;
    return j;
}

bool evaluation_service::dispatch_one(int shard) {
    unique_lock lock(mut);
    if (stopping || !pool.at(shard).can_accept()) return false;

    operation op;
    while (queue.pop_next(op)) {
        job j;
        try {
            j = build_job(op);
        } catch (std::exception &ex) {
            // 操作所需的数据已经不存在，这样的操作无论如何重试都不会成功
            report_error("Unable to prepare " + op.to_string() + ": " + ex.what());
            auto &result = load(op.submission_id, op.dataset_id);
            bool compiling = op.type == operation_type::COMPILATION && result.state == result_state::COMPILING;
            bool evaluating = op.type == operation_type::EVALUATION && result.state == result_state::EVALUATING;
            if (compiling || evaluating) {
                abandon(result, op.type);
                save(result);
            }
            continue;
        }

        unsigned long long attempt = ++next_attempt;
        auto &entry = pool.record(shard, op, attempt);
        auto token = entry.token;
        auto fp = op.fingerprint();
        ++outstanding_calls;
        call_monitor([&](monitor &m) { m.operation_dispatched(shard, op, attempt); });
        lock.unlock();

        json arguments = {{"operation", op}, {"attempt", attempt}, {"job", j}};
        client.call(WORKER_SERVICE, shard, "execute_operation", arguments, config.worker_timeout,
                    [this, shard, fp, attempt](const rpc::response &resp) {
                        defer {
                            scoped_lock guard(mut);
                            --outstanding_calls;
                            cond.notify_all();
                        };
                        operation_finished(shard, fp, attempt, resp);
                    },
                    token);
        return true;
    }
    return false;
}

void evaluation_service::operation_finished(int shard, const fingerprint &fp, unsigned long long attempt, const rpc::response &resp) {
    scoped_lock guard(mut);
    auto entry = pool.release(shard, fp, attempt);
    if (!entry) {
        DLOG(INFO) << "Ignoring reply of attempt " << attempt << " from worker " << shard;
        return;
    }

    outcome res;
    if (resp.is_ok()) {
        try {
            res = resp.data.get<outcome>();
        } catch (std::exception &ex) {
            res = outcome::infrastructure_failure(string("malformed outcome: ") + ex.what());
        }
    } else {
        res = outcome::infrastructure_failure(resp.status + ": " + resp.error());
    }
    call_monitor([&](monitor &m) { m.operation_finished(shard, entry->op, res); });

    if (resp.status == rpc::response_status::UNREACHABLE) {
        // worker 已经不可达，和心跳发现断开一样重新入队且不计入重试次数
        if (!entry->stale && !stopping) {
            operation op = entry->op;
            op.enqueued_at = chrono::system_clock::now();
            enqueue(op);
        }
        if (pool.at(shard).connected) disconnect_locked(shard, resp.error());
        return;
    }

    if (resp.status == rpc::response_status::TIMEOUT && pool.disable(shard)) {
        call_monitor([&](monitor &m) { m.worker_state_changed(shard, worker_state::DISABLED, "operation timed out"); });
    }

    if (entry->stale || stopping) return;

    const operation &op = entry->op;
    auto &result = load(op.submission_id, op.dataset_id);
    if (op.type == operation_type::COMPILATION) {
        if (result.state != result_state::COMPILING) return;
        compilation_finished(result, op, shard, res);
    } else {
        if (result.state != result_state::EVALUATING || result.evaluations.count(op.testcase_id)) return;
        evaluation_finished(result, op, shard, res);
    }
    save(result);
}

void evaluation_service::compilation_finished(submission_result &result, const operation &op, int shard, const outcome &res) {
    ++result.compilation_tries;
    result.compilation_shard = shard;
    result.compilation = res;

    if (is_infrastructure_failure(res.stat)) {
        if (result.compilation_tries < config.max_compilation_tries) {
            operation retry = op;
            retry.enqueued_at = chrono::system_clock::now();
            enqueue(retry);
        } else {
            abandon(result, operation_type::COMPILATION);
        }
        return;
    }

    if (res.stat == status::OK && !res.executable_digest.empty()) {
        transition(result, result_state::COMPILED);
        admit(result);
    } else {
        transition(result, result_state::COMPILATION_FAILED);
    }
}

void evaluation_service::evaluation_finished(submission_result &result, const operation &op, int shard, const outcome &res) {
    int tries = ++result.evaluation_tries[op.testcase_id];
    result.evaluation_shard = shard;

    if (is_infrastructure_failure(res.stat)) {
        if (tries < config.max_evaluation_tries) {
            operation retry = op;
            retry.enqueued_at = chrono::system_clock::now();
            enqueue(retry);
        } else {
            abandon(result, operation_type::EVALUATION);
        }
        return;
    }

    result.evaluations[op.testcase_id] = res;
    admit(result);
}

void evaluation_service::disconnect_locked(int shard, const string &reason) {
    auto lost = pool.disconnect(shard);
    for (auto &entry : lost) {
        entry.token->cancel();
        if (entry.stale) continue;
        operation op = entry.op;
        op.enqueued_at = chrono::system_clock::now();
        enqueue(op);
    }
    call_monitor([&](monitor &m) { m.worker_state_changed(shard, worker_state::DISCONNECTED, reason); });
    if (!lost.empty())
        LOG(WARNING) << "Worker " << shard << " lost " << lost.size() << " operations, requeued";
}

void evaluation_service::worker_disconnected(int shard, const string &reason) {
    scoped_lock guard(mut);
    if (pool.at(shard).connected) disconnect_locked(shard, reason);
}

void evaluation_service::check_connections() {
    vector<int> shards;
    {
        scoped_lock guard(mut);
        shards = pool.shards();
    }

    for (int shard : shards) {
        rpc::response resp = client.call_sync(WORKER_SERVICE, shard, "ping", json::object(), config.heartbeat_timeout);
        scoped_lock guard(mut);
        if (resp.is_ok()) {
            if (pool.connect(shard)) {
                call_monitor([&](monitor &m) { m.worker_state_changed(shard, worker_state::CONNECTED, ""); });
                cond.notify_all();
            }
        } else if (pool.at(shard).connected) {
            disconnect_locked(shard, resp.error());
        }
    }
}

size_t evaluation_service::judge_submission(const submission &submit) {
    size_t count = 0;
    for (auto &dataset_id : submissions.datasets_to_judge(submit)) {
        auto &result = load(submit.id, dataset_id);
        count += admit(result);
        save(result);
    }
    return count;
}

size_t evaluation_service::new_submission(const string &submission_id) {
    auto submit = submissions.find_submission(submission_id);
    if (!submit) throw invalid_argument("submission " + submission_id + " does not exist");

    scoped_lock guard(mut);
    return judge_submission(*submit);
}

size_t evaluation_service::invalidate_submission(const string &submission_id, const optional<string> &dataset_id, const string &level) {
    bool compilation;
    if (level == "compilation")
        compilation = true;
    else if (level == "evaluation")
        compilation = false;
    else
        throw invalid_argument("unknown invalidation level " + level);

    auto submit = submissions.find_submission(submission_id);
    if (!submit) throw invalid_argument("submission " + submission_id + " does not exist");

    vector<string> datasets = dataset_id ? vector<string>{*dataset_id} : submissions.datasets_to_judge(*submit);

    scoped_lock guard(mut);
    size_t count = 0;
    for (auto &ds : datasets) {
        auto &result = load(submission_id, ds);
        auto pred = [&](const operation &op) {
            return same_result(op, submission_id, ds) && (compilation || op.type == operation_type::EVALUATION);
        };
        queue.remove_if(pred);
        pool.mark_stale(pred);

        if (compilation) {
            result.reset_compilation();
        } else if (!result.reset_evaluation()) {
            continue;
        }
        call_monitor([&](monitor &m) { m.result_state_changed(result); });
        count += admit(result);
        save(result);
    }
    return count;
}

size_t evaluation_service::search_jobs_not_done() {
    size_t count = 0;
    for (auto &submission_id : submissions.list_submissions()) {
        auto submit = submissions.find_submission(submission_id);
        if (!submit) continue;
        scoped_lock guard(mut);
        count += judge_submission(*submit);
    }
    return count;
}

json evaluation_service::queue_status() {
    scoped_lock guard(mut);
    json list = json::array();
    for (auto &op : queue.peek_all())
        list.push_back({{"operation", op}, {"priority", op.priority}, {"timestamp", to_timestamp(op.enqueued_at)}});
    return list;
}

json evaluation_service::workers_status() {
    scoped_lock guard(mut);
    return pool.status();
}

json evaluation_service::submissions_status() {
    map<string, size_t> counts = {{"scored", 0}, {"evaluated", 0}, {"compilation_fail", 0}, {"compiling", 0},
                                  {"evaluating", 0}, {"max_compilations", 0}, {"max_evaluations", 0}};
    scoped_lock guard(mut);
    size_t total = 0;
    for (auto &result : submissions.list_results()) {
        ++total;
        switch (result.state) {
            case result_state::SCORED: ++counts["scored"]; break;
            case result_state::EVALUATED:
            case result_state::SCORING: ++counts["evaluated"]; break;
            case result_state::COMPILATION_FAILED: ++counts["compilation_fail"]; break;
            case result_state::COMPILING: ++counts["compiling"]; break;
            case result_state::COMPILED:
            case result_state::EVALUATING: ++counts["evaluating"]; break;
            case result_state::CANNOT_COMPILE: ++counts["max_compilations"]; break;
            case result_state::CANNOT_EVALUATE: ++counts["max_evaluations"]; break;
        }
    }
    json j = counts;
    j["total"] = total;
    return j;
}

bool evaluation_service::enable_worker(int shard) {
    scoped_lock guard(mut);
    if (!pool.enable(shard)) return false;
    call_monitor([&](monitor &m) { m.worker_state_changed(shard, worker_state::ENABLED, ""); });
    cond.notify_all();
    return true;
}

bool evaluation_service::disable_worker(int shard) {
    scoped_lock guard(mut);
    if (!pool.disable(shard)) return false;
    call_monitor([&](monitor &m) { m.worker_state_changed(shard, worker_state::DISABLED, "disabled by administrator"); });
    return true;
}

bool evaluation_service::wait_idle(chrono::milliseconds timeout) {
    unique_lock lock(mut);
    return cond.wait_for(lock, timeout, [&] { return queue.empty() && pool.total_in_flight() == 0; });
}

optional<submission_result> evaluation_service::result(const string &submission_id, const string &dataset_id) {
    scoped_lock guard(mut);
    auto it = results.find({submission_id, dataset_id});
    if (it != results.end()) return it->second;
    return submissions.load_result(submission_id, dataset_id);
}

void evaluation_service::dispatch_loop(int shard) {
    while (true) {
        {
            unique_lock lock(mut);
            cond.wait(lock, [&] { return stopping || (pool.at(shard).can_accept() && !queue.empty()); });
            if (stopping) return;
        }
        try {
            dispatch_one(shard);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to dispatch operation to worker " << shard << endl
                       << boost::diagnostic_information(ex);
        }
    }
}

void evaluation_service::housekeeping_loop() {
    auto last_search = chrono::steady_clock::now();
    auto last_gc = chrono::steady_clock::now();
    while (true) {
        {
            unique_lock lock(stop_mut);
            stop_cond.wait_for(lock, config.connection_check_interval);
        }
        {
            scoped_lock guard(mut);
            if (stopping) return;
        }

        try {
            check_connections();

            auto now = chrono::steady_clock::now();
            if (now - last_search >= config.jobs_not_done_interval) {
                last_search = now;
                size_t count = search_jobs_not_done();
                if (count) LOG(INFO) << "Found " << count << " operations not done";
            }

            if (objects && config.gc_interval.count() > 0 && now - last_gc >= config.gc_interval) {
                last_gc = now;
                auto report = store::collect_garbage(objects->durable_backend(), {&submissions}, store::gc_options());
                LOG(INFO) << "Garbage collection deleted " << report.deleted << " of " << report.scanned << " objects";
            }
        } catch (std::exception &ex) {
            LOG(ERROR) << "Evaluation service housekeeping failed" << endl
                       << boost::diagnostic_information(ex);
        }
    }
}

rpc::service &evaluation_service::admin_service() {
    if (admin) return *admin;

    admin = make_unique<rpc::service>("EvaluationService");
    admin->bind("new_submission", [this](const json &args) {
        return json{{"enqueued", new_submission(get_value<string>(args, "submission_id"))}};
    });
    admin->bind("invalidate_submission", [this](const json &args) {
        optional<string> dataset_id;
        if (exists(args, "dataset_id")) dataset_id = get_value<string>(args, "dataset_id");
        size_t count = invalidate_submission(get_value<string>(args, "submission_id"), dataset_id,
                                             get_value_def<string>(args, "compilation", "level"));
        return json{{"enqueued", count}};
    });
    admin->bind("queue_status", [this](const json &) { return queue_status(); });
    admin->bind("workers_status", [this](const json &) { return workers_status(); });
    admin->bind("submissions_status", [this](const json &) { return submissions_status(); });
    admin->bind("enable_worker", [this](const json &args) {
        return json{{"changed", enable_worker(get_value<int>(args, "shard"))}};
    });
    admin->bind("disable_worker", [this](const json &args) {
        return json{{"changed", disable_worker(get_value<int>(args, "shard"))}};
    });
    return *admin;
}

}  // namespace grader

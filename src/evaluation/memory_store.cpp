#include <glog/logging.h>
#include "common/json_utils.hpp"
#include "evaluation/job.hpp"
#include "evaluation/submission_store.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, testcase &tc) {
    j.at("id").get_to(tc.id);
    j.at("input").get_to(tc.input_digest);
    tc.output_digest = get_value_def<string>(j, "", "output");
}

void from_json(const json &j, dataset &ds) {
    j.at("id").get_to(ds.id);
    j.at("task").get_to(ds.task);
    if (exists(j, "limits")) j.at("limits").get_to(ds.limits);
    ds.managers = get_value_def<map<string, string>>(j, {}, "managers");
    ds.testcases = get_value_def<vector<testcase>>(j, {}, "testcases");
    ds.score_type = get_value_def<string>(j, "sum", "score_type");
    ds.input_file = get_value_def<string>(j, "", "input_file");
    ds.output_file = get_value_def<string>(j, "", "output_file");
}

void from_json(const json &j, language &lang) {
    j.at("name").get_to(lang.name);
    j.at("compile").get_to(lang.compile_command);
    j.at("run").get_to(lang.run_command);
    lang.executable = get_value_def<string>(j, "program", "executable");
    if (exists(j, "compile_limits")) j.at("compile_limits").get_to(lang.compile_limits);
}

void from_json(const json &j, submission &submit) {
    j.at("id").get_to(submit.id);
    j.at("task").get_to(submit.task);
    j.at("language").get_to(submit.language);
    submit.files = get_value_def<map<string, string>>(j, {}, "files");
}

void memory_store::load(const json &contest) {
    for (auto &lang : get_value_def<vector<language>>(contest, {}, "languages")) add_language(lang);
    for (auto &ds : get_value_def<vector<dataset>>(contest, {}, "datasets")) add_dataset(ds);
    for (auto &submit : get_value_def<vector<submission>>(contest, {}, "submissions")) add_submission(submit);
    LOG(INFO) << "Loaded " << languages.size() << " languages, " << datasets.size() << " datasets, "
              << submissions.size() << " submissions";
}

void memory_store::add_language(const language &lang) {
    lock_guard<mutex> guard(mut);
    languages[lang.name] = lang;
}

void memory_store::add_dataset(const dataset &ds) {
    lock_guard<mutex> guard(mut);
    datasets[ds.id] = ds;
}

void memory_store::add_submission(const submission &submit) {
    lock_guard<mutex> guard(mut);
    submissions[submit.id] = submit;
}

optional<submission> memory_store::find_submission(const string &submission_id) {
    lock_guard<mutex> guard(mut);
    auto it = submissions.find(submission_id);
    if (it == submissions.end()) return nullopt;
    return it->second;
}

optional<dataset> memory_store::find_dataset(const string &dataset_id) {
    lock_guard<mutex> guard(mut);
    auto it = datasets.find(dataset_id);
    if (it == datasets.end()) return nullopt;
    return it->second;
}

optional<language> memory_store::find_language(const string &name) {
    lock_guard<mutex> guard(mut);
    auto it = languages.find(name);
    if (it == languages.end()) return nullopt;
    return it->second;
}

vector<string> memory_store::datasets_to_judge(const submission &submit) {
    lock_guard<mutex> guard(mut);
    vector<string> result;
    for (auto &[id, ds] : datasets)
        if (ds.task == submit.task) result.push_back(id);
    return result;
}

vector<string> memory_store::list_submissions() {
    lock_guard<mutex> guard(mut);
    vector<string> result;
    for (auto &[id, submit] : submissions) result.push_back(id);
    return result;
}

optional<submission_result> memory_store::load_result(const string &submission_id, const string &dataset_id) {
    lock_guard<mutex> guard(mut);
    auto it = results.find({submission_id, dataset_id});
    if (it == results.end()) return nullopt;
    return it->second;
}

void memory_store::save(const submission_result &result) {
    lock_guard<mutex> guard(mut);
    results[{result.submission_id, result.dataset_id}] = result;
}

vector<submission_result> memory_store::list_results() {
    lock_guard<mutex> guard(mut);
    vector<submission_result> result;
    for (auto &[key, r] : results) result.push_back(r);
    return result;
}

string memory_store::name() const {
    return "contest";
}

void memory_store::enumerate(set<string> &digests) {
    lock_guard<mutex> guard(mut);
    auto add = [&](const string &digest) {
        if (!digest.empty()) digests.insert(digest);
    };

    for (auto &[id, submit] : submissions)
        for (auto &[name, digest] : submit.files) add(digest);
    for (auto &[id, ds] : datasets) {
        for (auto &[name, digest] : ds.managers) add(digest);
        for (auto &tc : ds.testcases) {
            add(tc.input_digest);
            add(tc.output_digest);
        }
    }
    for (auto &[key, result] : results) {
        add(result.compilation.executable_digest);
        add(result.compilation.stdout_digest);
        add(result.compilation.stderr_digest);
        for (auto &[tc, evaluation] : result.evaluations) {
            add(evaluation.output_digest);
            add(evaluation.stdout_digest);
            add(evaluation.stderr_digest);
        }
    }
}

}  // namespace grader

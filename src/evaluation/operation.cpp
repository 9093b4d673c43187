#include "evaluation/operation.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const char *get_display_message(operation_type type) {
    switch (type) {
        case operation_type::COMPILATION: return "compile";
        case operation_type::EVALUATION: return "evaluate";
    }
    throw invalid_argument("unknown operation type");
}

static operation_type parse_operation_type(const string &name) {
    if (name == "compile") return operation_type::COMPILATION;
    if (name == "evaluate") return operation_type::EVALUATION;
    throw invalid_argument("unknown operation type " + name);
}

fingerprint operation::fingerprint() const {
    return {type, submission_id, dataset_id, testcase_id, priority};
}

string operation::to_string() const {
    if (type == operation_type::COMPILATION)
        return fmt::format("compile submission {} on dataset {}", submission_id, dataset_id);
    else
        return fmt::format("evaluate submission {} on dataset {}, testcase {}", submission_id, dataset_id, testcase_id);
}

operation operation::compilation(const string &submission_id, const string &dataset_id, int priority) {
    operation op;
    op.type = operation_type::COMPILATION;
    op.submission_id = submission_id;
    op.dataset_id = dataset_id;
    op.priority = priority;
    op.enqueued_at = chrono::system_clock::now();
    return op;
}

operation operation::evaluation(const string &submission_id, const string &dataset_id, const string &testcase_id, int priority) {
    operation op = compilation(submission_id, dataset_id, priority);
    op.type = operation_type::EVALUATION;
    op.testcase_id = testcase_id;
    return op;
}

bool same_result(const operation &a, const string &submission_id, const string &dataset_id) {
    return a.submission_id == submission_id && a.dataset_id == dataset_id;
}

double to_timestamp(const chrono::system_clock::time_point &time) {
    return chrono::duration_cast<chrono::duration<double>>(time.time_since_epoch()).count();
}

chrono::system_clock::time_point from_timestamp(double timestamp) {
    return chrono::system_clock::time_point(chrono::duration_cast<chrono::system_clock::duration>(chrono::duration<double>(timestamp)));
}

void to_json(json &j, const operation &op) {
    j = {{"type", get_display_message(op.type)},
         {"submission_id", op.submission_id},
         {"dataset_id", op.dataset_id},
         {"priority", op.priority},
         {"enqueued_at", to_timestamp(op.enqueued_at)}};
    if (op.type == operation_type::EVALUATION)
        j["testcase_id"] = op.testcase_id;
}

void from_json(const json &j, operation &op) {
    op.type = parse_operation_type(j.at("type").get<string>());
    j.at("submission_id").get_to(op.submission_id);
    j.at("dataset_id").get_to(op.dataset_id);
    op.testcase_id = get_value_def<string>(j, "", "testcase_id");
    op.priority = get_value_def<int>(j, 0, "priority");
    op.enqueued_at = from_timestamp(get_value_def<double>(j, 0, "enqueued_at"));
}

}  // namespace grader

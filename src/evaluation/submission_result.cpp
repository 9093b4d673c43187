#include "evaluation/submission_result.hpp"
#include <boost/assign.hpp>
#include <boost/throw_exception.hpp>
#include <set>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "evaluation/operation.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<result_state, const char *> state_string = boost::assign::map_list_of
    (result_state::COMPILING, "compiling")
    (result_state::COMPILATION_FAILED, "compilation_failed")
    (result_state::COMPILED, "compiled")
    (result_state::EVALUATING, "evaluating")
    (result_state::EVALUATED, "evaluated")
    (result_state::SCORING, "scoring")
    (result_state::SCORED, "scored")
    (result_state::CANNOT_COMPILE, "cannot_compile")
    (result_state::CANNOT_EVALUATE, "cannot_evaluate");

static const map<result_state, set<result_state>> transitions = boost::assign::map_list_of
    (result_state::COMPILING, set<result_state>{result_state::COMPILATION_FAILED, result_state::COMPILED, result_state::CANNOT_COMPILE})
    (result_state::COMPILED, set<result_state>{result_state::EVALUATING})
    (result_state::EVALUATING, set<result_state>{result_state::EVALUATED, result_state::CANNOT_EVALUATE})
    (result_state::EVALUATED, set<result_state>{result_state::SCORING})
    (result_state::SCORING, set<result_state>{result_state::SCORED});
// clang-format on

const char *get_display_message(result_state state) {
    return state_string.at(state);
}

void to_json(json &j, const result_state &state) {
    j = get_display_message(state);
}

void from_json(const json &j, result_state &state) {
    string name = j.get<string>();
    for (auto &[s, str] : state_string)
        if (name == str) {
            state = s;
            return;
        }
    throw invalid_argument("unknown result state " + name);
}

void submission_result::transition(result_state next) {
    auto it = transitions.find(state);
    if (it == transitions.end() || !it->second.count(next))
        BOOST_THROW_EXCEPTION(internal_error(string("illegal transition of submission ") + submission_id + " on dataset " + dataset_id +
                                             " from " + get_display_message(state) + " to " + get_display_message(next)));

    state = next;
    auto now = chrono::system_clock::now();
    if (next == result_state::COMPILED) compiled_at = now;
    if (next == result_state::EVALUATED) evaluated_at = now;
    if (next == result_state::SCORED && !scored_at) scored_at = now;
}

void submission_result::reset_compilation() {
    state = result_state::COMPILING;
    compilation_tries = 0;
    compilation_shard = -1;
    compilation = outcome();
    compiled_at.reset();
    evaluation_tries.clear();
    evaluation_shard = -1;
    evaluations.clear();
    evaluated_at.reset();
    score = 0;
}

bool submission_result::reset_evaluation() {
    if (!compiled()) return false;
    state = result_state::EVALUATING;
    evaluation_tries.clear();
    evaluation_shard = -1;
    evaluations.clear();
    evaluated_at.reset();
    score = 0;
    return true;
}

bool submission_result::compiled() const {
    switch (state) {
        case result_state::COMPILED:
        case result_state::EVALUATING:
        case result_state::EVALUATED:
        case result_state::SCORING:
        case result_state::SCORED:
        case result_state::CANNOT_EVALUATE:
            return true;
        default:
            return false;
    }
}

bool submission_result::finished() const {
    return state == result_state::COMPILATION_FAILED || state == result_state::SCORED ||
           state == result_state::CANNOT_COMPILE || state == result_state::CANNOT_EVALUATE;
}

static json optional_time(const optional<chrono::system_clock::time_point> &time) {
    return time ? json(to_timestamp(*time)) : json();
}

static optional<chrono::system_clock::time_point> parse_optional_time(const json &j, const char *key) {
    json value = access_optional(j, key);
    if (value.is_null()) return nullopt;
    return from_timestamp(value.get<double>());
}

void to_json(json &j, const submission_result &result) {
    j = {{"submission_id", result.submission_id},
         {"dataset_id", result.dataset_id},
         {"state", result.state},
         {"compilation_tries", result.compilation_tries},
         {"evaluation_tries", result.evaluation_tries},
         {"compilation_shard", result.compilation_shard},
         {"evaluation_shard", result.evaluation_shard},
         {"compilation", result.compilation},
         {"evaluations", result.evaluations},
         {"score", result.score},
         {"created_at", to_timestamp(result.created_at)},
         {"compiled_at", optional_time(result.compiled_at)},
         {"evaluated_at", optional_time(result.evaluated_at)},
         {"scored_at", optional_time(result.scored_at)}};
}

void from_json(const json &j, submission_result &result) {
    j.at("submission_id").get_to(result.submission_id);
    j.at("dataset_id").get_to(result.dataset_id);
    j.at("state").get_to(result.state);
    result.compilation_tries = get_value_def<int>(j, 0, "compilation_tries");
    result.evaluation_tries = get_value_def<map<string, int>>(j, {}, "evaluation_tries");
    result.compilation_shard = get_value_def<int>(j, -1, "compilation_shard");
    result.evaluation_shard = get_value_def<int>(j, -1, "evaluation_shard");
    if (exists(j, "compilation")) j.at("compilation").get_to(result.compilation);
    result.evaluations = get_value_def<map<string, outcome>>(j, {}, "evaluations");
    result.score = get_value_def<double>(j, 0, "score");
    result.created_at = from_timestamp(get_value_def<double>(j, 0, "created_at"));
    result.compiled_at = parse_optional_time(j, "compiled_at");
    result.evaluated_at = parse_optional_time(j, "evaluated_at");
    result.scored_at = parse_optional_time(j, "scored_at");
}

}  // namespace grader

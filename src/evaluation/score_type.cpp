#include "evaluation/score_type.hpp"
#include <stdexcept>

namespace grader {
using namespace std;

score_type::~score_type() = default;

string sum_score_type::name() const {
    return "sum";
}

double sum_score_type::compute(const dataset &ds, const submission_result &result) const {
    if (ds.testcases.empty()) return 0;

    int passed = 0;
    for (auto &tc : ds.testcases) {
        auto it = result.evaluations.find(tc.id);
        if (it == result.evaluations.end() || it->second.stat != status::OK) continue;
        if (!tc.output_digest.empty() && it->second.output_digest != tc.output_digest) continue;
        ++passed;
    }
    return 100.0 * passed / ds.testcases.size();
}

unique_ptr<score_type> make_score_type(const string &name) {
    if (name == "sum") return make_unique<sum_score_type>();
    throw invalid_argument("unknown score type " + name);
}

}  // namespace grader

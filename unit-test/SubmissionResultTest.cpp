#include "common/exceptions.hpp"
#include "evaluation/submission_result.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

class SubmissionResultTest : public ::testing::Test {
protected:
    submission_result result;

    void SetUp() override {
        result.submission_id = "s1";
        result.dataset_id = "d1";
        result.created_at = chrono::system_clock::now();
    }
};

TEST_F(SubmissionResultTest, LegalTransitionTest) {
    result.transition(result_state::COMPILED);
    EXPECT_TRUE(result.compiled_at.has_value());
    result.transition(result_state::EVALUATING);
    result.transition(result_state::EVALUATED);
    EXPECT_TRUE(result.evaluated_at.has_value());
    result.transition(result_state::SCORING);
    result.transition(result_state::SCORED);
    EXPECT_TRUE(result.scored_at.has_value());
    EXPECT_TRUE(result.finished());
}

TEST_F(SubmissionResultTest, IllegalTransitionTest) {
    EXPECT_THROW(result.transition(result_state::SCORED), internal_error);
    EXPECT_THROW(result.transition(result_state::EVALUATING), internal_error);
    EXPECT_EQ(result.state, result_state::COMPILING);

    result.transition(result_state::CANNOT_COMPILE);
    EXPECT_THROW(result.transition(result_state::COMPILED), internal_error);
}

TEST_F(SubmissionResultTest, ScoredAtIsSetOnceTest) {
    result.transition(result_state::COMPILED);
    result.transition(result_state::EVALUATING);
    result.transition(result_state::EVALUATED);
    result.transition(result_state::SCORING);
    result.transition(result_state::SCORED);
    auto scored_at = result.scored_at;

    ASSERT_TRUE(result.reset_evaluation());
    EXPECT_EQ(result.state, result_state::EVALUATING);
    result.transition(result_state::EVALUATED);
    result.transition(result_state::SCORING);
    result.transition(result_state::SCORED);
    EXPECT_EQ(result.scored_at, scored_at);
}

TEST_F(SubmissionResultTest, ResetTest) {
    EXPECT_FALSE(result.reset_evaluation());

    result.compilation_tries = 2;
    result.transition(result_state::COMPILED);
    result.transition(result_state::EVALUATING);
    result.evaluation_tries["t1"] = 1;
    result.evaluations["t1"].stat = status::OK;

    result.reset_compilation();
    EXPECT_EQ(result.state, result_state::COMPILING);
    EXPECT_EQ(result.compilation_tries, 0);
    EXPECT_TRUE(result.evaluations.empty());
    EXPECT_TRUE(result.evaluation_tries.empty());
    EXPECT_FALSE(result.compiled_at.has_value());
}

TEST_F(SubmissionResultTest, JsonTest) {
    result.transition(result_state::COMPILED);
    result.compilation.stat = status::OK;
    result.compilation.executable_digest = "a9993e364706816aba3e25717850c26c9cd0d89d";
    result.evaluation_tries["t1"] = 2;

    nlohmann::json j = result;
    EXPECT_EQ(j["state"], "compiled");
    EXPECT_TRUE(j["scored_at"].is_null());

    auto parsed = j.get<submission_result>();
    EXPECT_EQ(parsed.state, result_state::COMPILED);
    EXPECT_EQ(parsed.compilation.executable_digest, result.compilation.executable_digest);
    EXPECT_EQ(parsed.evaluation_tries.at("t1"), 2);
    EXPECT_FALSE(parsed.scored_at.has_value());

    EXPECT_THROW(nlohmann::json("bogus").get<result_state>(), invalid_argument);
}

#include "evaluation/operation_queue.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

class OperationQueueTest : public ::testing::Test {
protected:
    operation_queue queue;

    operation evaluate(const string &testcase_id, int priority, int seconds_ago = 0) {
        auto op = operation::evaluation("s1", "d1", testcase_id, priority);
        op.enqueued_at -= chrono::seconds(seconds_ago);
        return op;
    }
};

TEST_F(OperationQueueTest, EnqueueIsIdempotentTest) {
    EXPECT_TRUE(queue.enqueue(operation::compilation("s1", "d1", 3)));
    EXPECT_FALSE(queue.enqueue(operation::compilation("s1", "d1", 3)));
    EXPECT_EQ(queue.size(), 1);
    EXPECT_TRUE(queue.contains(operation::compilation("s1", "d1", 3).fingerprint()));

    // 不同数据集的编译是不同的操作
    EXPECT_TRUE(queue.enqueue(operation::compilation("s1", "d2", 3)));
    EXPECT_EQ(queue.size(), 2);
}

TEST_F(OperationQueueTest, PriorityOrderTest) {
    queue.enqueue(evaluate("a", 5));
    queue.enqueue(evaluate("b", 1));
    queue.enqueue(evaluate("c", 5));
    queue.enqueue(evaluate("d", 3));

    vector<string> popped;
    operation op;
    while (queue.pop_next(op)) popped.push_back(op.testcase_id + to_string(op.priority));
    EXPECT_EQ(popped, vector<string>({"a5", "c5", "d3", "b1"}));
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.pop_next(op));
}

TEST_F(OperationQueueTest, OlderFirstTest) {
    queue.enqueue(evaluate("new", 2, 0));
    queue.enqueue(evaluate("old", 2, 60));

    auto all = queue.peek_all();
    ASSERT_EQ(all.size(), 2);
    EXPECT_EQ(all[0].testcase_id, "old");
    EXPECT_EQ(all[1].testcase_id, "new");
    EXPECT_EQ(queue.size(), 2);
}

TEST_F(OperationQueueTest, RemoveTest) {
    queue.enqueue(evaluate("t1", 2));
    queue.enqueue(evaluate("t2", 2));
    queue.enqueue(operation::evaluation("s2", "d1", "t1", 2));

    EXPECT_TRUE(queue.remove(evaluate("t1", 2).fingerprint()));
    EXPECT_FALSE(queue.remove(evaluate("t1", 2).fingerprint()));
    EXPECT_EQ(queue.size(), 2);

    EXPECT_EQ(queue.remove_if([](const operation &op) { return same_result(op, "s1", "d1"); }), 1);
    EXPECT_EQ(queue.size(), 1);
    EXPECT_EQ(queue.peek_all()[0].submission_id, "s2");

    // 删除之后可以重新加入
    EXPECT_TRUE(queue.enqueue(evaluate("t1", 2)));
}

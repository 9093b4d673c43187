#include <future>
#include <mutex>
#include <set>
#include <thread>
#include "evaluation/evaluation_service.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "rpc/local_transport.hpp"
#include "test/environment.hpp"
#include "worker.hpp"

using namespace std;
using namespace grader;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

/**
 * @brief 记录结果状态变化的监控器
 */
struct recording_monitor : public monitor {
    mutex &mut;
    vector<result_state> &states;

    recording_monitor(mutex &mut, vector<result_state> &states) : mut(mut), states(states) {}

    void result_state_changed(const submission_result &result) override {
        scoped_lock guard(mut);
        states.push_back(result.state);
    }
};

/**
 * @brief 让模拟沙箱阻塞到测试放行为止，析构时自动放行
 */
struct gate {
    promise<void> entered;
    promise<void> opened;
    shared_future<void> opened_future = opened.get_future().share();
    once_flag entered_flag, opened_flag;

    ~gate() {
        open();
    }

    void open() {
        call_once(opened_flag, [this] { opened.set_value(); });
    }

    /**
     * @brief 在沙箱中调用，通知测试已经开始执行并等待放行
     */
    void pass() {
        call_once(entered_flag, [this] { entered.set_value(); });
        opened_future.wait();
    }
};

class EvaluationServiceTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    unique_ptr<store::object_store> objects = make_memory_object_store();
    memory_store contest;
    process_sandbox real_sandbox;
    mock_sandbox fake_sandbox;
    unique_ptr<worker> w;
    unique_ptr<worker> w2;
    rpc::local_transport transport;
    unique_ptr<rpc::client> client;
    unique_ptr<evaluation_service> service;

    mutex states_mutex;
    vector<result_state> states;

    /**
     * @brief 准备比赛和 worker 1，second 非空时再准备使用该沙箱的 worker 2
     */
    void prepare(int testcases, sandbox &box, evaluation_config config = evaluation_config(),
                 chrono::milliseconds poll_interval = chrono::milliseconds(10), sandbox *second = nullptr) {
        prepare_contest(contest, *objects, testcases);

        w = make_unique<worker>(1, *objects, box, 2);
        transport.serve("Worker", 1, w->rpc_service(), 2);
        config.workers = {{1, 1}};
        if (second) {
            w2 = make_unique<worker>(2, *objects, *second, 2);
            transport.serve("Worker", 2, w2->rpc_service(), 2);
            config.workers.push_back({2, 1});
        }

        config.heartbeat_timeout = chrono::milliseconds(1000);
        config.connection_check_interval = chrono::milliseconds(60000);
        config.jobs_not_done_interval = chrono::milliseconds(60000);
        client = make_unique<rpc::client>(transport, poll_interval);
        service = make_unique<evaluation_service>(config, contest, *client, objects.get());
        service->register_monitor(make_unique<recording_monitor>(states_mutex, states));
    }

    void TearDown() override {
        if (service) service->stop();
        service.reset();
        client.reset();
        transport.stop();
    }

    submission_result result() {
        auto res = service->result("s1", "d1");
        EXPECT_TRUE(res.has_value());
        return res.value_or(submission_result());
    }

    bool wait_for_queue(size_t size, chrono::milliseconds timeout) {
        auto deadline = chrono::steady_clock::now() + timeout;
        while (chrono::steady_clock::now() < deadline) {
            if (service->queue_status().size() == size) return true;
            this_thread::sleep_for(chrono::milliseconds(5));
        }
        return false;
    }
};

TEST_F(EvaluationServiceTest, EndToEndTest) {
    prepare(3, real_sandbox);

    service->check_connections();
    EXPECT_EQ(service->new_submission("s1"), 1);

    auto queue = service->queue_status();
    ASSERT_EQ(queue.size(), 1);
    EXPECT_EQ(queue[0]["priority"], 3);
    EXPECT_EQ(queue[0]["operation"]["type"], "compile");

    ASSERT_TRUE(service->dispatch_one(1));
    ASSERT_TRUE(wait_for_queue(3, chrono::seconds(10)));
    for (auto &entry : service->queue_status()) {
        EXPECT_EQ(entry["priority"], 2);
        EXPECT_EQ(entry["operation"]["type"], "evaluate");
    }

    service->start();
    ASSERT_TRUE(service->wait_idle(chrono::seconds(20)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::SCORED);
    EXPECT_EQ(res.evaluations.size(), 3);
    EXPECT_DOUBLE_EQ(res.score, 100);
    EXPECT_EQ(res.compilation_tries, 1);
    EXPECT_TRUE(res.scored_at.has_value());

    scoped_lock guard(states_mutex);
    vector<result_state> expected = {result_state::COMPILED, result_state::EVALUATING, result_state::EVALUATED,
                                     result_state::SCORING, result_state::SCORED};
    EXPECT_EQ(states, expected);
}

TEST_F(EvaluationServiceTest, CompilationRetryExhaustedTest) {
    EXPECT_CALL(fake_sandbox, run(_))
        .Times(3)
        .WillRepeatedly(Return(make_execution_result(status::SANDBOX_ERROR)));
    prepare(1, fake_sandbox);

    service->start();
    EXPECT_EQ(service->new_submission("s1"), 1);
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::CANNOT_COMPILE);
    EXPECT_EQ(res.compilation_tries, 3);
    EXPECT_FALSE(res.scored_at.has_value());
    EXPECT_EQ(service->submissions_status()["max_compilations"], 1);

    // 已经放弃的结果不会因为重新扫描而再次评测
    EXPECT_EQ(service->search_jobs_not_done(), 0);
}

TEST_F(EvaluationServiceTest, CompilationFailedIsNotRetriedTest) {
    EXPECT_CALL(fake_sandbox, run(_))
        .Times(1)
        .WillOnce(Return(make_execution_result(status::RUNTIME_ERROR)));
    prepare(1, fake_sandbox);

    service->start();
    service->new_submission("s1");
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::COMPILATION_FAILED);
    EXPECT_EQ(res.compilation.stat, status::RUNTIME_ERROR);
}

TEST_F(EvaluationServiceTest, WorkerDisconnectedTest) {
    gate g;
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Invoke([&](const execution &) {
            g.pass();
            return make_execution_result(status::OK, "program", "echo 0");
        }))
        .WillOnce(Return(make_execution_result(status::OK, "program", "echo 0")));
    // 使用默认的轮询间隔，心跳间隔很长，断开只能由轮询发现
    prepare(0, fake_sandbox, evaluation_config(), chrono::milliseconds(500));

    service->check_connections();
    service->new_submission("s1");
    ASSERT_TRUE(service->dispatch_one(1));
    g.entered.get_future().wait();

    transport.disconnect("Worker", 1);
    ASSERT_TRUE(wait_for_queue(1, chrono::seconds(5)));
    EXPECT_FALSE(service->workers_status()["1"]["connected"].get<bool>());
    EXPECT_EQ(result().state, result_state::COMPILING);
    EXPECT_EQ(result().compilation_tries, 0);
    EXPECT_FALSE(service->dispatch_one(1));

    // 断开时间再长也不会消耗重试次数
    this_thread::sleep_for(chrono::seconds(2));
    EXPECT_EQ(result().state, result_state::COMPILING);
    EXPECT_EQ(service->queue_status().size(), 1);

    transport.reconnect("Worker", 1);
    service->check_connections();
    EXPECT_TRUE(service->workers_status()["1"]["connected"].get<bool>());
    ASSERT_TRUE(service->dispatch_one(1));
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::SCORED);
    EXPECT_EQ(res.compilation_tries, 1);
}

TEST_F(EvaluationServiceTest, OperationMovesToAnotherWorkerTest) {
    gate g;
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Invoke([&](const execution &) {
            g.pass();
            return make_execution_result(status::OK, "program", "echo 0");
        }));
    prepare(1, fake_sandbox, evaluation_config(), chrono::milliseconds(500), &real_sandbox);

    // 保证编译先交给 worker 1
    service->disable_worker(2);
    service->start();
    service->new_submission("s1");
    g.entered.get_future().wait();
    service->enable_worker(2);

    transport.disconnect("Worker", 1);
    ASSERT_TRUE(service->wait_idle(chrono::seconds(20)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::SCORED);
    EXPECT_EQ(res.compilation_tries, 1);
    EXPECT_EQ(res.compilation_shard, 2);
    EXPECT_DOUBLE_EQ(res.score, 100);
    EXPECT_FALSE(service->workers_status()["1"]["connected"].get<bool>());
}

TEST_F(EvaluationServiceTest, OneOperationInFlightTest) {
    gate g;
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Invoke([&](const execution &) {
            g.pass();
            return make_execution_result(status::OK, "program", "echo 0");
        }));
    prepare(0, fake_sandbox);

    service->check_connections();
    EXPECT_EQ(service->new_submission("s1"), 1);
    ASSERT_TRUE(service->dispatch_one(1));
    g.entered.get_future().wait();

    // 编译正在进行时再次提交不会产生第二个相同的操作
    EXPECT_EQ(service->new_submission("s1"), 0);
    EXPECT_EQ(service->search_jobs_not_done(), 0);
    EXPECT_TRUE(service->queue_status().empty());

    g.open();
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));
    EXPECT_EQ(result().state, result_state::SCORED);
    EXPECT_EQ(result().compilation_tries, 1);
}

TEST_F(EvaluationServiceTest, EvaluationRetryExhaustedTest) {
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Return(make_execution_result(status::OK, "program", "echo 0")))
        .WillRepeatedly(Return(make_execution_result(status::SANDBOX_ERROR)));
    prepare(1, fake_sandbox);

    service->start();
    service->new_submission("s1");
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::CANNOT_EVALUATE);
    EXPECT_EQ(res.compilation_tries, 1);
    EXPECT_EQ(res.evaluation_tries["t1"], 3);
    EXPECT_TRUE(res.evaluations.empty());
    EXPECT_FALSE(res.scored_at.has_value());
    EXPECT_EQ(service->submissions_status()["max_evaluations"], 1);
    EXPECT_EQ(service->search_jobs_not_done(), 0);
}

TEST_F(EvaluationServiceTest, EvaluationFailureIsNotRetriedTest) {
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Return(make_execution_result(status::OK, "program", "echo 0")))
        .WillOnce(Return(make_execution_result(status::RUNTIME_ERROR)))
        .WillOnce(Return(make_execution_result(status::TIME_LIMIT_EXCEEDED)));
    prepare(2, fake_sandbox);

    service->start();
    service->new_submission("s1");
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::SCORED);
    ASSERT_EQ(res.evaluations.size(), 2);
    EXPECT_EQ(res.evaluation_tries["t1"], 1);
    EXPECT_EQ(res.evaluation_tries["t2"], 1);
    multiset<status> stats = {res.evaluations["t1"].stat, res.evaluations["t2"].stat};
    multiset<status> expected = {status::RUNTIME_ERROR, status::TIME_LIMIT_EXCEEDED};
    EXPECT_EQ(stats, expected);
    EXPECT_DOUBLE_EQ(res.score, 0);
}

TEST_F(EvaluationServiceTest, StaleReplyTest) {
    prepare(1, fake_sandbox);

    service->check_connections();
    service->new_submission("s1");

    outcome fake;
    fake.stat = status::OK;
    fake.executable_digest = objects->put("echo 0");
    auto op = operation::compilation("s1", "d1", 3);
    service->operation_finished(1, op.fingerprint(), 12345, rpc::response::ok(fake));

    auto res = result();
    EXPECT_EQ(res.state, result_state::COMPILING);
    EXPECT_EQ(res.compilation_tries, 0);
    EXPECT_EQ(service->queue_status().size(), 1);
}

TEST_F(EvaluationServiceTest, InvalidateEvaluationTest) {
    prepare(2, real_sandbox);

    service->start();
    service->new_submission("s1");
    ASSERT_TRUE(service->wait_idle(chrono::seconds(20)));
    auto first = result();
    ASSERT_EQ(first.state, result_state::SCORED);

    EXPECT_EQ(service->invalidate_submission("s1", string("d1"), "evaluation"), 2);
    ASSERT_TRUE(service->wait_idle(chrono::seconds(20)));

    auto second = result();
    EXPECT_EQ(second.state, result_state::SCORED);
    EXPECT_EQ(second.compilation_tries, first.compilation_tries);
    EXPECT_EQ(second.compilation.executable_digest, first.compilation.executable_digest);
    EXPECT_DOUBLE_EQ(second.score, 100);
    EXPECT_EQ(second.scored_at, first.scored_at);
}

TEST_F(EvaluationServiceTest, InvalidateCompilationTest) {
    prepare(1, real_sandbox);

    service->start();
    service->new_submission("s1");
    ASSERT_TRUE(service->wait_idle(chrono::seconds(20)));

    EXPECT_EQ(service->invalidate_submission("s1", nullopt, "compilation"), 1);
    ASSERT_TRUE(service->wait_idle(chrono::seconds(20)));
    EXPECT_EQ(result().state, result_state::SCORED);
    EXPECT_EQ(result().compilation_tries, 1);
}

TEST_F(EvaluationServiceTest, InvalidArgumentTest) {
    prepare(1, fake_sandbox);

    EXPECT_THROW(service->invalidate_submission("s1", nullopt, "everything"), invalid_argument);
    EXPECT_THROW(service->new_submission("s2"), invalid_argument);
    EXPECT_THROW(service->enable_worker(7), invalid_argument);
}

TEST_F(EvaluationServiceTest, DisableWorkerTest) {
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Return(make_execution_result(status::OK, "program", "echo 0")));
    prepare(0, fake_sandbox);

    EXPECT_TRUE(service->disable_worker(1));
    EXPECT_FALSE(service->disable_worker(1));

    service->start();
    service->new_submission("s1");
    EXPECT_FALSE(service->wait_idle(chrono::milliseconds(300)));
    EXPECT_EQ(service->queue_status().size(), 1);

    EXPECT_TRUE(service->enable_worker(1));
    ASSERT_TRUE(service->wait_idle(chrono::seconds(10)));
    EXPECT_EQ(result().state, result_state::SCORED);
}

TEST_F(EvaluationServiceTest, WorkerTimeoutTest) {
    EXPECT_CALL(fake_sandbox, run(_))
        .WillOnce(Invoke([](const execution &) {
            this_thread::sleep_for(chrono::milliseconds(500));
            return make_execution_result(status::OK, "program", "echo 0");
        }));
    evaluation_config config;
    config.worker_timeout = chrono::milliseconds(100);
    prepare(0, fake_sandbox, config);

    service->check_connections();
    service->new_submission("s1");
    ASSERT_TRUE(service->dispatch_one(1));
    ASSERT_TRUE(wait_for_queue(1, chrono::seconds(5)));

    auto res = result();
    EXPECT_EQ(res.state, result_state::COMPILING);
    EXPECT_EQ(res.compilation_tries, 1);
    EXPECT_FALSE(service->workers_status()["1"]["enabled"].get<bool>());
    EXPECT_FALSE(service->dispatch_one(1));
}

TEST_F(EvaluationServiceTest, AdminServiceTest) {
    prepare(1, fake_sandbox);
    auto &admin = service->admin_service();
    EXPECT_EQ(admin.name(), "EvaluationService");

    rpc::request req{"r1", "EvaluationService", 0, "new_submission", {{"submission_id", "s1"}}};
    auto resp = admin.handle(req);
    ASSERT_TRUE(resp.is_ok());
    EXPECT_EQ(resp.data["enqueued"], 1);

    req.method = "queue_status";
    resp = admin.handle(req);
    ASSERT_TRUE(resp.is_ok());
    EXPECT_EQ(resp.data.size(), 1);

    req.method = "invalidate_submission";
    req.arguments = {{"submission_id", "s1"}, {"level", "bogus"}};
    EXPECT_FALSE(admin.handle(req).is_ok());

    req.method = "no_such_method";
    EXPECT_FALSE(admin.handle(req).is_ok());
}

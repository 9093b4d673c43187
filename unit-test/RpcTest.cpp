#include <atomic>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "rpc/client.hpp"
#include "rpc/local_transport.hpp"
#include "rpc/mq_transport.hpp"
#include "rpc/service.hpp"

using namespace std;
using namespace grader;
using namespace grader::rpc;

class RpcTest : public ::testing::Test {
protected:
    service echo{"Echo"};
    local_transport transport;
    promise<void> release_slow;
    shared_future<void> slow_released = release_slow.get_future().share();

    void SetUp() override {
        echo.bind("echo", [](const nlohmann::json &args) { return args; });
        echo.bind("fail", [](const nlohmann::json &) -> nlohmann::json { throw invalid_argument("bad request"); });
        echo.bind("slow", [this](const nlohmann::json &args) {
            slow_released.wait_for(chrono::seconds(5));
            return args;
        });
        transport.serve("Echo", 0, echo, 2);
    }

    void TearDown() override {
        try {
            release_slow.set_value();
        } catch (future_error &) {
            // 测试中已经释放
        }
        transport.stop();
    }
};

TEST_F(RpcTest, MessageJsonTest) {
    request req{"id", "Worker", 3, "ping", {{"x", 1}}};
    auto parsed = nlohmann::json(req).get<request>();
    EXPECT_EQ(parsed.service, "Worker");
    EXPECT_EQ(parsed.shard, 3);
    EXPECT_EQ(parsed.arguments["x"], 1);

    EXPECT_TRUE(response::ok(1).is_ok());
    EXPECT_TRUE(response::wait().is_pending());
    EXPECT_EQ(response::fail("boom").error(), "boom");
    EXPECT_EQ(nlohmann::json(response::timeout()).get<response>().status, response_status::TIMEOUT);
    EXPECT_EQ(routing_key_of("Worker", 3), "Worker.3");
}

TEST_F(RpcTest, AsyncCallTest) {
    client c(transport, chrono::milliseconds(10));
    atomic<bool> completed{false};
    auto handle = c.call("Echo", 0, "echo", {{"value", 42}}, chrono::seconds(5),
                         [&](const response &) { completed = true; });

    response resp = handle.result.get();
    ASSERT_TRUE(resp.is_ok()) << resp.error();
    EXPECT_EQ(resp.data["value"], 42);
    EXPECT_TRUE(completed);
}

TEST_F(RpcTest, SyncCallTest) {
    client c(transport);
    response resp = c.call_sync("Echo", 0, "echo", {{"value", "hi"}}, chrono::seconds(5));
    ASSERT_TRUE(resp.is_ok());
    EXPECT_EQ(resp.data["value"], "hi");

    resp = c.call_sync("Echo", 0, "fail", nlohmann::json::object(), chrono::seconds(5));
    EXPECT_EQ(resp.status, response_status::FAIL);
    EXPECT_NE(resp.error().find("bad request"), string::npos);

    resp = c.call_sync("Echo", 0, "unknown", nlohmann::json::object(), chrono::seconds(5));
    EXPECT_EQ(resp.status, response_status::FAIL);
}

TEST_F(RpcTest, UnknownEndpointTest) {
    client c(transport, chrono::milliseconds(10));
    EXPECT_EQ(c.call_sync("Nobody", 0, "echo", nlohmann::json::object(), chrono::seconds(1)).status, response_status::UNREACHABLE);
    EXPECT_EQ(c.call("Echo", 9, "echo", nlohmann::json::object(), chrono::seconds(1)).result.get().status, response_status::UNREACHABLE);
}

TEST_F(RpcTest, TimeoutTest) {
    client c(transport, chrono::milliseconds(10));
    auto handle = c.call("Echo", 0, "slow", nlohmann::json::object(), chrono::milliseconds(100));
    EXPECT_EQ(handle.result.get().status, response_status::TIMEOUT);

    EXPECT_EQ(c.call_sync("Echo", 0, "slow", nlohmann::json::object(), chrono::milliseconds(100)).status, response_status::TIMEOUT);
}

TEST_F(RpcTest, CancelTest) {
    client c(transport, chrono::milliseconds(10));
    auto handle = c.call("Echo", 0, "slow", nlohmann::json::object(), chrono::seconds(5));
    handle.token->cancel();
    EXPECT_EQ(handle.result.get().status, response_status::CANCELLED);
}

TEST_F(RpcTest, DisconnectTest) {
    client c(transport, chrono::milliseconds(10));
    auto handle = c.call("Echo", 0, "slow", nlohmann::json::object(), chrono::seconds(5));
    this_thread::sleep_for(chrono::milliseconds(50));

    transport.disconnect("Echo", 0);
    auto lost = handle.result.get();
    EXPECT_EQ(lost.status, response_status::UNREACHABLE);
    EXPECT_FALSE(lost.error().empty());
    EXPECT_EQ(c.call_sync("Echo", 0, "echo", nlohmann::json::object(), chrono::seconds(1)).status, response_status::UNREACHABLE);

    release_slow.set_value();
    transport.reconnect("Echo", 0);
    response resp = c.call_sync("Echo", 0, "echo", {{"after", true}}, chrono::seconds(5));
    ASSERT_TRUE(resp.is_ok()) << resp.error();
    EXPECT_EQ(resp.data["after"], true);
}

TEST_F(RpcTest, ClientDestructorCancelsCallsTest) {
    shared_future<response> result;
    {
        client c(transport, chrono::milliseconds(10));
        result = c.call("Echo", 0, "slow", nlohmann::json::object(), chrono::seconds(5)).result;
    }
    EXPECT_EQ(result.get().status, response_status::CANCELLED);
}

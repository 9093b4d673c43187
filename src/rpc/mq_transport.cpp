#include "rpc/mq_transport.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>
#include <cmath>
#include "common/exceptions.hpp"

namespace grader::rpc {
using namespace std;
using namespace nlohmann;

string routing_key_of(const string &service, int shard) {
    return service + "." + to_string(shard);
}

static string result_key(const string &id) {
    return "rpc:" + id;
}

static string done_key(const string &id) {
    return "rpc:" + id + ":done";
}

static response parse_result(const string &id, const cpp_redis::reply &reply) {
    if (reply.is_null())
        BOOST_THROW_EXCEPTION(network_error("unknown request id " + id));
    if (!reply.is_string())
        BOOST_THROW_EXCEPTION(network_error("malformed response of request " + id));
    try {
        return json::parse(reply.as_string()).get<response>();
    } catch (json::exception &e) {
        BOOST_THROW_EXCEPTION(network_error("malformed response of request " + id + ": " + e.what()));
    }
}

mq_transport::mq_transport(const amqp &amqp_config, const redis &redis_config)
    : amqp_config(amqp_config), redis_config(redis_config), publisher(amqp_config) {
    results.init(redis_config);
}

void mq_transport::submit(const request &req) {
    // 先写入 wait 状态，保证被调用方还没取到请求时轮询也能得到 wait
    string pending = json(response::wait()).dump();
    results.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.setex(result_key(req.id), redis_config.result_ttl, pending));
    });
    publisher.publish(routing_key_of(req.service, req.shard), json(req).dump());
}

response mq_transport::fetch(const string &id) {
    auto replies = results.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.get(result_key(id)));
    });
    return parse_result(id, replies.at(0));
}

response mq_transport::invoke(const request &req, chrono::milliseconds timeout) {
    submit(req);

    // BLPOP 会阻塞整个连接，因此使用单独的连接等待
    redis_conn waiter;
    waiter.init(redis_config);
    int seconds = max(1, (int)ceil(timeout.count() / 1000.0));
    auto popped = waiter.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.blpop({done_key(req.id)}, seconds));
    });

    response resp = popped.at(0).is_null() ? response::timeout() : fetch(req.id);
    release(req.id);
    return resp;
}

void mq_transport::release(const string &id) {
    results.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        replies.push_back(redis.del({result_key(id), done_key(id)}));
    });
}

mq_server::mq_server(const amqp &amqp_config, const redis &redis_config)
    : amqp_config(amqp_config), redis_config(redis_config) {}

mq_server::~mq_server() {
    stop();
}

void mq_server::serve(int shard, service &handler, size_t count) {
    for (size_t i = 0; i < count; ++i)
        threads.emplace_back([this, shard, &handler] { consume(shard, handler); });
}

void mq_server::stop() {
    stopping = true;
    for (auto &th : threads)
        if (th.joinable()) th.join();
    threads.clear();
}

void mq_server::consume(int shard, service &handler) {
    string key = routing_key_of(handler.name(), shard);
    LOG(INFO) << "Serving " << key << " on exchange " << amqp_config.exchange;

    unique_ptr<rabbitmq> queue;
    redis_conn results;
    results.init(redis_config);

    while (!stopping) {
        try {
            if (!queue) queue = make_unique<rabbitmq>(amqp_config, amqp_config.exchange + "." + key, key);

            AmqpClient::Envelope::ptr_t envelope;
            if (!queue->fetch(envelope, 1000)) continue;
            queue->ack(envelope);

            request req;
            try {
                req = json::parse(envelope->Message()->Body()).get<request>();
            } catch (json::exception &e) {
                LOG(ERROR) << "Dropping malformed request on " << key << ": " << e.what();
                continue;
            }

            string reply = json(handler.handle(req)).dump();
            results.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
                replies.push_back(redis.setex(result_key(req.id), redis_config.result_ttl, reply));
                replies.push_back(redis.rpush(done_key(req.id), {"1"}));
                replies.push_back(redis.expire(done_key(req.id), redis_config.result_ttl));
            });
        } catch (network_error &ex) {
            LOG(ERROR) << "Serving " << key << " failed, retrying: " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            queue.reset();
            this_thread::sleep_for(chrono::seconds(5));
        }
    }
}

}  // namespace grader::rpc

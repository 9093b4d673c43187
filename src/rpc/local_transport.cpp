#include "rpc/local_transport.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"

namespace grader::rpc {
using namespace std;

local_transport::~local_transport() {
    stop();
}

void local_transport::serve(const string &service_name, int shard, service &handler, size_t threads) {
    lock_guard<mutex> guard(mut);
    endpoint_key key{service_name, shard};
    if (endpoints.count(key))
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("endpoint {}.{} is already served", service_name, shard)));

    auto ep = make_unique<endpoint>();
    ep->handler = &handler;
    for (size_t i = 0; i < threads; ++i)
        ep->threads.emplace_back([this, ptr = ep.get()] { run_endpoint(*ptr); });
    endpoints[key] = move(ep);
}

void local_transport::run_endpoint(endpoint &ep) {
    envelope env;
    while (!ep.inbox.is_closed()) {
        if (!ep.inbox.pop_for(env, chrono::milliseconds(100))) continue;

        {
            lock_guard<mutex> guard(mut);
            if (env.generation != ep.generation) continue;
        }

        response resp = ep.handler->handle(env.req);

        {
            lock_guard<mutex> guard(mut);
            auto it = results.find(env.req.id);
            // 端点断开期间产生的结果丢失，调用方已经释放的结果也不再保存
            if (env.generation != ep.generation || it == results.end()) {
                DLOG(INFO) << "Dropping reply of request " << env.req.id;
                continue;
            }
            it->second.resp = resp;
        }
        cond.notify_all();
    }
}

local_transport::endpoint &local_transport::connected_endpoint(const endpoint_key &key) {
    auto it = endpoints.find(key);
    if (it == endpoints.end() || !it->second->connected)
        BOOST_THROW_EXCEPTION(network_error(fmt::format("connection refused by {}.{}", key.first, key.second)));
    return *it->second;
}

void local_transport::submit(const request &req) {
    lock_guard<mutex> guard(mut);
    endpoint_key key{req.service, req.shard};
    endpoint &ep = connected_endpoint(key);
    if (results.count(req.id))
        BOOST_THROW_EXCEPTION(network_error("duplicated request id " + req.id));
    results[req.id] = {key, ep.generation, response::wait()};
    ep.inbox.push({req, ep.generation});
}

response local_transport::fetch(const string &id) {
    lock_guard<mutex> guard(mut);
    auto it = results.find(id);
    if (it == results.end())
        BOOST_THROW_EXCEPTION(network_error("unknown request id " + id));
    endpoint &ep = connected_endpoint(it->second.owner);
    if (ep.generation != it->second.generation)
        BOOST_THROW_EXCEPTION(network_error("connection reset while waiting for request " + id));
    return it->second.resp;
}

response local_transport::invoke(const request &req, chrono::milliseconds timeout) {
    submit(req);

    unique_lock<mutex> lock(mut);
    bool done = cond.wait_for(lock, timeout, [&] {
        auto it = results.find(req.id);
        if (it == results.end()) return true;
        auto ep = endpoints.find(it->second.owner);
        return !ep->second->connected || ep->second->generation != it->second.generation || !it->second.resp.is_pending();
    });

    auto it = results.find(req.id);
    if (it == results.end())
        BOOST_THROW_EXCEPTION(network_error("request " + req.id + " released while waiting"));
    pending_result result = it->second;
    results.erase(it);

    auto &ep = *endpoints.at(result.owner);
    if (!ep.connected || ep.generation != result.generation)
        BOOST_THROW_EXCEPTION(network_error("connection reset while waiting for request " + req.id));
    if (!done) return response::timeout();
    return result.resp;
}

void local_transport::release(const string &id) {
    lock_guard<mutex> guard(mut);
    results.erase(id);
}

void local_transport::disconnect(const string &service_name, int shard) {
    {
        lock_guard<mutex> guard(mut);
        auto &ep = *endpoints.at({service_name, shard});
        ep.connected = false;
        ++ep.generation;
        LOG(INFO) << "Endpoint " << service_name << "." << shard << " disconnected";
    }
    cond.notify_all();
}

void local_transport::reconnect(const string &service_name, int shard) {
    lock_guard<mutex> guard(mut);
    auto &ep = *endpoints.at({service_name, shard});
    ep.connected = true;
    LOG(INFO) << "Endpoint " << service_name << "." << shard << " reconnected";
}

void local_transport::stop() {
    vector<thread> threads;
    {
        lock_guard<mutex> guard(mut);
        for (auto &[key, ep] : endpoints) {
            ep->inbox.close();
            for (auto &th : ep->threads) threads.push_back(move(th));
            ep->threads.clear();
        }
    }
    for (auto &th : threads)
        if (th.joinable()) th.join();
}

}  // namespace grader::rpc

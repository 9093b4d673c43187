#include "rpc/client.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader::rpc {
using namespace std;

client::client(transport &t, chrono::milliseconds poll_interval)
    : t(t), poll_interval(poll_interval) {}

client::~client() {
    map<string, pair<thread, shared_ptr<cancellation_token>>> remaining;
    {
        lock_guard<mutex> guard(mut);
        remaining.swap(calls);
        finished.clear();
    }
    for (auto &[id, call] : remaining) call.second->cancel();
    for (auto &[id, call] : remaining)
        if (call.first.joinable()) call.first.join();
}

response client::poll(const request &req, chrono::milliseconds timeout, cancellation_token &token) {
    auto deadline = chrono::steady_clock::now() + timeout;
    response resp;
    try {
        t.submit(req);
        while (true) {
            if (token.wait_for(poll_interval)) {
                resp = response::cancelled();
                break;
            }
            resp = t.fetch(req.id);
            if (!resp.is_pending()) break;
            if (chrono::steady_clock::now() >= deadline) {
                LOG(WARNING) << "Request " << req.id << " to " << req.service << "." << req.shard << "/" << req.method << " timed out";
                resp = response::timeout();
                break;
            }
        }
    } catch (network_error &ex) {
        LOG(WARNING) << "Request " << req.id << " to " << req.service << "." << req.shard << "/" << req.method
                     << " failed: " << ex.what();
        resp = response::unreachable(ex.what());
    }

    try {
        t.release(req.id);
    } catch (network_error &ex) {
        LOG(WARNING) << "Unable to release request " << req.id << ": " << ex.what();
    }
    return resp;
}

void client::join_finished(unique_lock<mutex> &lock) {
    vector<thread> threads;
    for (auto &id : finished) {
        auto it = calls.find(id);
        if (it == calls.end()) continue;
        threads.push_back(move(it->second.first));
        calls.erase(it);
    }
    finished.clear();

    lock.unlock();
    for (auto &th : threads)
        if (th.joinable()) th.join();
    lock.lock();
}

call_handle client::call(const string &service, int shard, const string &method, const nlohmann::json &arguments,
                         chrono::milliseconds timeout, function<void(const response &)> on_complete,
                         shared_ptr<cancellation_token> token) {
    request req{random_id(), service, shard, method, arguments};
    if (!token) token = make_shared<cancellation_token>();
    auto promise = make_shared<std::promise<response>>();
    call_handle handle{req.id, token, promise->get_future().share()};

    unique_lock<mutex> lock(mut);
    join_finished(lock);
    thread th([this, req, timeout, token, promise, on_complete] {
        response resp = poll(req, timeout, *token);
        if (on_complete) {
            try {
                on_complete(resp);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Completion handler of request " << req.id << " crashed: " << ex.what() << endl
                           << boost::diagnostic_information(ex);
            }
        }
        promise->set_value(resp);

        lock_guard<mutex> guard(mut);
        finished.push_back(req.id);
    });
    calls.emplace(req.id, make_pair(move(th), token));
    return handle;
}

response client::call_sync(const string &service, int shard, const string &method, const nlohmann::json &arguments,
                           chrono::milliseconds timeout) {
    request req{random_id(), service, shard, method, arguments};
    try {
        return t.invoke(req, timeout);
    } catch (network_error &ex) {
        LOG(WARNING) << "Request " << req.id << " to " << service << "." << shard << "/" << method << " failed: " << ex.what();
        return response::unreachable(ex.what());
    }
}

size_t client::outstanding() {
    lock_guard<mutex> guard(mut);
    return calls.size() - finished.size();
}

}  // namespace grader::rpc

#include "evaluation/worker_pool.hpp"
#include <stdexcept>

namespace grader {
using namespace std;
using namespace nlohmann;

bool worker_record::can_accept() const {
    return connected && enabled && operations.size() < capacity;
}

void worker_pool::add_worker(int shard, size_t capacity) {
    worker_record record;
    record.shard = shard;
    record.capacity = capacity;
    record.since = chrono::system_clock::now();
    workers[shard] = move(record);
}

bool worker_pool::contains(int shard) const {
    return workers.count(shard);
}

worker_record &worker_pool::at(int shard) {
    auto it = workers.find(shard);
    if (it == workers.end())
        throw invalid_argument("unknown worker " + to_string(shard));
    return it->second;
}

const worker_record &worker_pool::at(int shard) const {
    auto it = workers.find(shard);
    if (it == workers.end())
        throw invalid_argument("unknown worker " + to_string(shard));
    return it->second;
}

vector<int> worker_pool::shards() const {
    vector<int> result;
    for (auto &[shard, record] : workers) result.push_back(shard);
    return result;
}

bool worker_pool::in_flight(const fingerprint &fp) const {
    for (auto &[shard, record] : workers)
        for (auto &entry : record.operations)
            if (!entry.stale && entry.op.fingerprint() == fp) return true;
    return false;
}

dispatch_entry &worker_pool::record(int shard, const operation &op, unsigned long long attempt) {
    dispatch_entry entry;
    entry.op = op;
    entry.attempt = attempt;
    entry.dispatched_at = chrono::system_clock::now();
    entry.token = make_shared<rpc::cancellation_token>();
    auto &operations = at(shard).operations;
    operations.push_back(move(entry));
    return operations.back();
}

optional<dispatch_entry> worker_pool::release(int shard, const fingerprint &fp, unsigned long long attempt) {
    auto &operations = at(shard).operations;
    for (auto it = operations.begin(); it != operations.end(); ++it) {
        if (it->attempt == attempt && it->op.fingerprint() == fp) {
            dispatch_entry entry = move(*it);
            operations.erase(it);
            return entry;
        }
    }
    return nullopt;
}

bool worker_pool::connect(int shard) {
    auto &record = at(shard);
    if (record.connected) return false;
    record.connected = true;
    record.since = chrono::system_clock::now();
    return true;
}

vector<dispatch_entry> worker_pool::disconnect(int shard) {
    auto &record = at(shard);
    vector<dispatch_entry> lost(make_move_iterator(record.operations.begin()), make_move_iterator(record.operations.end()));
    record.operations.clear();
    if (record.connected) {
        record.connected = false;
        record.since = chrono::system_clock::now();
    }
    return lost;
}

bool worker_pool::enable(int shard) {
    auto &record = at(shard);
    if (record.enabled) return false;
    record.enabled = true;
    return true;
}

bool worker_pool::disable(int shard) {
    auto &record = at(shard);
    if (!record.enabled) return false;
    record.enabled = false;
    return true;
}

size_t worker_pool::mark_stale(const function<bool(const operation &)> &pred) {
    size_t count = 0;
    for (auto &[shard, record] : workers)
        for (auto &entry : record.operations)
            if (!entry.stale && pred(entry.op)) {
                entry.stale = true;
                ++count;
            }
    return count;
}

size_t worker_pool::total_in_flight() const {
    size_t count = 0;
    for (auto &[shard, record] : workers) count += record.operations.size();
    return count;
}

json worker_pool::status() const {
    json result = json::object();
    for (auto &[shard, record] : workers) {
        json operations = json::array();
        for (auto &entry : record.operations) {
            json op = entry.op;
            op["attempt"] = entry.attempt;
            op["dispatched_at"] = to_timestamp(entry.dispatched_at);
            op["stale"] = entry.stale;
            operations.push_back(op);
        }
        result[to_string(shard)] = {{"connected", record.connected},
                                    {"enabled", record.enabled},
                                    {"capacity", record.capacity},
                                    {"operations", operations},
                                    {"start_time", to_timestamp(record.since)}};
    }
    return result;
}

}  // namespace grader

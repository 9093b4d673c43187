#include "evaluation/operation_queue.hpp"

namespace grader {
using namespace std;

bool operation_queue::entry_order::operator()(const entry &a, const entry &b) const {
    if (a.op.priority != b.op.priority) return a.op.priority > b.op.priority;
    if (a.op.enqueued_at != b.op.enqueued_at) return a.op.enqueued_at < b.op.enqueued_at;
    return a.sequence < b.sequence;
}

bool operation_queue::enqueue(const operation &op) {
    fingerprint fp = op.fingerprint();
    if (index.count(fp)) return false;
    auto it = entries.insert({op, next_sequence++}).first;
    index.emplace(fp, it);
    return true;
}

bool operation_queue::pop_next(operation &op) {
    if (entries.empty()) return false;
    auto it = entries.begin();
    op = it->op;
    index.erase(op.fingerprint());
    entries.erase(it);
    return true;
}

vector<operation> operation_queue::peek_all() const {
    vector<operation> result;
    for (auto &e : entries) result.push_back(e.op);
    return result;
}

bool operation_queue::contains(const fingerprint &fp) const {
    return index.count(fp);
}

bool operation_queue::remove(const fingerprint &fp) {
    auto it = index.find(fp);
    if (it == index.end()) return false;
    entries.erase(it->second);
    index.erase(it);
    return true;
}

size_t operation_queue::remove_if(const function<bool(const operation &)> &pred) {
    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (pred(it->op)) {
            index.erase(it->op.fingerprint());
            it = entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t operation_queue::size() const {
    return entries.size();
}

bool operation_queue::empty() const {
    return entries.empty();
}

}  // namespace grader

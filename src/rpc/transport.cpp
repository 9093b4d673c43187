#include "rpc/transport.hpp"

namespace grader::rpc {
using namespace std;

transport::~transport() = default;

void cancellation_token::cancel() {
    {
        lock_guard<mutex> guard(mut);
        flag = true;
    }
    cond.notify_all();
}

bool cancellation_token::cancelled() const {
    return flag;
}

bool cancellation_token::wait_for(chrono::milliseconds duration) {
    unique_lock<mutex> lock(mut);
    return cond.wait_for(lock, duration, [this] { return flag.load(); });
}

}  // namespace grader::rpc

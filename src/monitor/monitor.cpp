#include "monitor/monitor.hpp"
#include <glog/logging.h>

namespace grader {
using namespace std;

const char *get_display_message(worker_state state) {
    switch (state) {
        case worker_state::CONNECTED: return "connected";
        case worker_state::DISCONNECTED: return "disconnected";
        case worker_state::ENABLED: return "enabled";
        case worker_state::DISABLED: return "disabled";
    }
    return "unknown";
}

monitor::~monitor() = default;

void monitor::operation_dispatched(int, const operation &, unsigned long long) {}

void monitor::operation_finished(int, const operation &, const outcome &) {}

void monitor::result_state_changed(const submission_result &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::report_error(const string &) {}

void log_monitor::operation_dispatched(int shard, const operation &op, unsigned long long attempt) {
    LOG(INFO) << "Worker " << shard << " starts to " << op.to_string() << " (attempt " << attempt << ")";
}

void log_monitor::operation_finished(int shard, const operation &op, const outcome &result) {
    LOG(INFO) << "Worker " << shard << " finished to " << op.to_string() << ": " << get_display_message(result.stat)
              << (result.message.empty() ? "" : ", " + result.message);
}

void log_monitor::result_state_changed(const submission_result &result) {
    LOG(INFO) << "Submission " << result.submission_id << " on dataset " << result.dataset_id
              << " is " << get_display_message(result.state);
}

void log_monitor::worker_state_changed(int shard, worker_state state, const string &information) {
    LOG(INFO) << "Worker " << shard << " is " << get_display_message(state)
              << (information.empty() ? "" : ": " + information);
}

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << message;
}

}  // namespace grader

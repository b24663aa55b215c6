#include "monitor/interrupt_monitor.hpp"

#include "logging.hpp"

using namespace std;

namespace grader {

void interrupt_monitor::start_job(int worker_id, const job_message &message) {
    scoped_lock guard(mut);
    running[worker_id] = message;
}

void interrupt_monitor::end_job(int worker_id, const job_message &, const execution_result &) {
    scoped_lock guard(mut);
    running.erase(worker_id);
}

void interrupt_monitor::interrupt_jobs() {
    scoped_lock guard(mut);

    LOG_ERROR << "Jobs under grading";
    for (auto &[worker_id, message] : running) {
        LOG_ERROR << "worker" << worker_id << ": " << message.job.name() << " attempt " << message.retry.attempt;
    }
}

size_t interrupt_monitor::running_jobs() {
    scoped_lock guard(mut);
    return running.size();
}

}  // namespace grader

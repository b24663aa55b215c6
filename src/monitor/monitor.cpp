#include "monitor/monitor.hpp"

namespace grader {

std::string state_name(worker_state state) {
    switch (state) {
        case worker_state::GRADING:
            return "grading";
        case worker_state::CRASHED:
            return "crashed";
        case worker_state::IDLE:
            return "idle";
        case worker_state::START:
            return "start";
        case worker_state::STOPPED:
            return "stopped";
    }
    return "unknown";
}

monitor::~monitor() {}

void monitor::start_job(int, const job_message &) {}

void monitor::end_job(int, const job_message &, const execution_result &) {}

void monitor::worker_state_changed(int, worker_state, const std::string &) {}

void monitor::report_error(int, const std::string &) {}

void monitor::interrupt_jobs() {}

}  // namespace grader

#pragma once

#include "metrics.hpp"
#include "monitor/monitor.hpp"

namespace grader {

/**
 * @brief 通过 Prometheus 报告 worker 的状态
 */
struct prometheus_monitor : public monitor {
    prometheus::Family<prometheus::Counter> &jobs_started, &jobs_ended;
    prometheus::Family<prometheus::Gauge> &up, &workers, &worker_status, &job_duration;

    explicit prometheus_monitor(prometheus::Registry &registry);

    void start_job(int worker_id, const job_message &message) override;
    void end_job(int worker_id, const job_message &message, const execution_result &result) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &info) override;
};

}  // namespace grader

#include "monitor/prometheus.hpp"

#include <prometheus/gauge.h>

namespace grader {
using namespace std;

prometheus_monitor::prometheus_monitor(prometheus::Registry &registry)
    : jobs_started(prometheus::BuildCounter()
                       .Name("grading_system_jobs_started_total")
                       .Help("The number of grading attempts that have started")
                       .Register(registry)),
      jobs_ended(prometheus::BuildCounter()
                     .Name("grading_system_jobs_ended_total")
                     .Help("The number of grading attempts that have finished")
                     .Register(registry)),
      up(prometheus::BuildGauge()
             .Name("grading_system_up")
             .Help("Whether the grading system is running")
             .Register(registry)),
      workers(prometheus::BuildGauge()
                  .Name("grading_system_workers")
                  .Help("The number of running workers")
                  .Register(registry)),
      worker_status(prometheus::BuildGauge()
                        .Name("grading_system_workers_status")
                        .Help("Show status of each worker (0:START   ; 1:GRADING   ; 2:IDLE   ; 3:CRASHED   ; 4:STOPPED)")
                        .Register(registry)),
      job_duration(prometheus::BuildGauge()
                       .Name("grading_system_job_duration_ms")
                       .Help("The wall-clock time of the latest grading attempt (/ms)")
                       .Register(registry)) {
    up.Add({}).Set(1);
}

void prometheus_monitor::start_job(int worker_id, const job_message &message) {
    jobs_started.Add({{"worker_id", to_string(worker_id)},
                      {"task_id", message.job.task_id},
                      {"kind", kind_name(message.job.kind)}})
        .Increment();
}

void prometheus_monitor::end_job(int worker_id, const job_message &message, const execution_result &result) {
    jobs_ended.Add({{"worker_id", to_string(worker_id)},
                    {"task_id", message.job.task_id},
                    {"kind", kind_name(message.job.kind)}})
        .Increment();
    job_duration.Add({{"task_id", message.job.task_id},
                      {"kind", kind_name(message.job.kind)}})
        .Set(result.duration.count());
}

void prometheus_monitor::worker_state_changed(int worker_id, worker_state state, const string & /* info */) {
    worker_status.Add({{"worker_id", to_string(worker_id)}}).Set(static_cast<int>(state));

    if (state == worker_state::START)
        workers.Add({}).Increment();
    else if (state == worker_state::STOPPED || state == worker_state::CRASHED)
        workers.Add({}).Decrement();
}

}  // namespace grader

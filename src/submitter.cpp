#include "submitter.hpp"

#include "logging.hpp"

namespace grader {
using namespace std;

job_submitter::job_submitter(server::job_queue &queue, grading_metrics &metrics)
    : queue(queue), metrics(metrics) {}

job_message job_submitter::submit(job_descriptor job) {
    if (job.enqueued_at.time_since_epoch().count() == 0)
        job.enqueued_at = chrono::system_clock::now();

    job_message message;
    message.job = move(job);
    message.retry.attempt = 1;
    message.retry.not_before = message.job.enqueued_at;

    queue.publish(message);
    metrics.job_pushed(message.job);
    LOG_INFO << "Published job " << message.job.name();
    return message;
}

}  // namespace grader

#include "metrics.hpp"

namespace grader {
using namespace std;

grading_metrics::grading_metrics(prometheus::Registry &registry)
    : pushed(prometheus::BuildCounter()
                 .Name("submissions_pushed_total")
                 .Help("The number of grading jobs published to the job queue")
                 .Register(registry)),
      success(prometheus::BuildCounter()
                  .Name("submissions_success_total")
                  .Help("The number of grading jobs that passed")
                  .Register(registry)),
      failed(prometheus::BuildCounter()
                 .Name("submissions_failed_total")
                 .Help("The number of grading jobs that failed or timed out")
                 .Register(registry)),
      outcomes(prometheus::BuildCounter()
                   .Name("submissions_outcomes_total")
                   .Help("The number of persisted grading results by outcome")
                   .Register(registry)),
      retried(prometheus::BuildCounter()
                  .Name("submissions_retried_total")
                  .Help("The number of grading jobs republished after an infrastructure error")
                  .Register(registry)),
      infra_failures(prometheus::BuildCounter()
                         .Name("submissions_infra_failures_total")
                         .Help("The number of grading jobs that exhausted their retries")
                         .Register(registry)),
      logins_failed(prometheus::BuildCounter()
                        .Name("auth_logins_failed_total")
                        .Help("The number of failed logins reported by the web layer")
                        .Register(registry)) {
    logins_failed.Add({});
}

void grading_metrics::job_pushed(const job_descriptor &job) {
    pushed.Add({{"task_id", job.task_id}}).Increment();
}

void grading_metrics::job_finished(const job_descriptor &job, const outcome &o) {
    string kind = kind_name(job.kind);
    outcomes.Add({{"task_id", job.task_id}, {"kind", kind}, {"outcome", outcome_name(o)}}).Increment();

    visit(overloaded{
              [&](const grader::passed &) { success.Add({{"task_id", job.task_id}, {"kind", kind}}).Increment(); },
              [&](const grader::failed &) { failed.Add({{"task_id", job.task_id}, {"kind", kind}}).Increment(); },
              [&](const grader::timed_out &) { failed.Add({{"task_id", job.task_id}, {"kind", kind}}).Increment(); },
              [&](const grader::infra_error &) { infra_failures.Add({{"task_id", job.task_id}}).Increment(); }},
          o);
}

void grading_metrics::job_retried(const job_descriptor &job) {
    retried.Add({{"task_id", job.task_id}}).Increment();
}

void grading_metrics::login_failed() {
    logins_failed.Add({}).Increment();
}

double grading_metrics::pushed_count(const string &task_id) {
    return pushed.Add({{"task_id", task_id}}).Value();
}

double grading_metrics::success_count(const string &task_id, test_kind kind) {
    return success.Add({{"task_id", task_id}, {"kind", kind_name(kind)}}).Value();
}

double grading_metrics::failed_count(const string &task_id, test_kind kind) {
    return failed.Add({{"task_id", task_id}, {"kind", kind_name(kind)}}).Value();
}

double grading_metrics::infra_failure_count(const string &task_id) {
    return infra_failures.Add({{"task_id", task_id}}).Value();
}

}  // namespace grader

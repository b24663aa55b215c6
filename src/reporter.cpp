#include "reporter.hpp"

#include <boost/exception/diagnostic_information.hpp>

#include "logging.hpp"

namespace grader {
using namespace std;

result_record make_record(const job_message &message, const outcome &o, const execution_result &result) {
    result_record record;
    record.submission_id = message.job.submission_id;
    record.task_id = message.job.task_id;
    record.kind = message.job.kind;
    record.outcome = outcome_name(o);
    record.reason = outcome_detail(o);
    record.exit_code = result.exitcode;
    record.output = result.output;
    record.error = result.error;
    record.truncated = result.truncated;
    record.duration = result.duration;
    record.attempt = message.retry.attempt;
    record.created_at = chrono::system_clock::now();
    return record;
}

void to_json(nlohmann::json &j, const result_record &record) {
    j = {{"submission_id", record.submission_id},
         {"task_id", record.task_id},
         {"kind", kind_name(record.kind)},
         {"outcome", record.outcome},
         {"reason", ensure_utf8(record.reason)},
         {"exit_code", record.exit_code},
         {"stdout", ensure_utf8(record.output)},
         {"stderr", ensure_utf8(record.error)},
         {"truncated", record.truncated},
         {"duration_ms", record.duration.count()},
         {"attempt", record.attempt},
         {"created_at", chrono::duration_cast<chrono::milliseconds>(record.created_at.time_since_epoch()).count()}};
}

result_store::~result_store() {}

result_reporter::result_reporter(result_store &store, grading_metrics &metrics)
    : store(store), metrics(metrics) {}

bool result_reporter::report(const job_message &message, const outcome &o, const execution_result &result) {
    result_record record = make_record(message, o, result);
    if (!store.save(record)) {
        LOG_INFO << "Result of " << message.job.name() << " has already been recorded, skipping";
        return false;
    }

    LOG_INFO << "Recorded " << record.outcome << " for " << message.job.name() << " at attempt " << record.attempt;
    metrics.job_finished(message.job, o);

    for (auto &callback : listeners) {
        try {
            callback(record);
        } catch (std::exception &ex) {
            LOG_ERROR << "Unable to notify result of " << message.job.name() << ": " << ex.what() << endl
                      << boost::diagnostic_information(ex);
        }
    }
    return true;
}

vector<result_record> result_reporter::poll_result(const string &submission_id) {
    return store.find(submission_id);
}

void result_reporter::on_result(listener callback) {
    listeners.push_back(move(callback));
}

}  // namespace grader

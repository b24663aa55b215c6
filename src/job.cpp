#include "job.hpp"

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static int64_t to_millis(chrono::system_clock::time_point tp) {
    return chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch()).count();
}

static chrono::system_clock::time_point from_millis(int64_t ms) {
    return chrono::system_clock::time_point(chrono::milliseconds(ms));
}

string kind_name(test_kind kind) {
    switch (kind) {
        case test_kind::PUBLIC:
            return "public";
        case test_kind::PRIVATE:
            return "private";
    }
    return "unknown";
}

test_kind parse_test_kind(const string &kind) {
    if (kind == "public") return test_kind::PUBLIC;
    if (kind == "private") return test_kind::PRIVATE;
    BOOST_THROW_EXCEPTION(invalid_job() << "unrecognized test kind " << kind);
}

string job_descriptor::name() const {
    return task_id + "-" + submission_id + "-" + kind_name(kind);
}

job_descriptor make_job(string submission_id, string task_id, test_kind kind, string image, vector<string> command, string input, resource_limits limits) {
    job_descriptor job;
    job.submission_id = move(submission_id);
    job.task_id = move(task_id);
    job.kind = kind;
    job.image = move(image);
    job.command = move(command);
    job.input = move(input);
    job.limits = limits;
    job.enqueued_at = chrono::system_clock::now();
    return job;
}

void from_json(const json &j, resource_limits &limits) {
    assign_optional(j, limits.cpus, "cpus");
    assign_optional(j, limits.memory_mb, "memory_mb");
    assign_optional(j, limits.time_limit, "time_limit_s");
    assign_optional(j, limits.pids, "pids");

    if (limits.cpus <= 0 || limits.memory_mb <= 0 || limits.time_limit <= 0 || limits.pids <= 0)
        BOOST_THROW_EXCEPTION(invalid_job() << "resource limits must be positive");
}

void to_json(json &j, const resource_limits &limits) {
    j = {{"cpus", limits.cpus},
         {"memory_mb", limits.memory_mb},
         {"time_limit_s", limits.time_limit},
         {"pids", limits.pids}};
}

void from_json(const json &j, job_descriptor &job) {
    j.at("submission_id").get_to(job.submission_id);
    j.at("task_id").get_to(job.task_id);
    job.kind = parse_test_kind(j.at("kind").get<string>());
    j.at("image").get_to(job.image);
    assign_optional(j, job.command, "command");
    assign_optional(j, job.input, "input");
    assign_optional(j, job.limits, "limits");

    int64_t enqueued_at = 0;
    assign_optional(j, enqueued_at, "enqueued_at");
    job.enqueued_at = from_millis(enqueued_at);

    // 提交 id 和题目 id 会被用于拼接工作目录
    assert_safe_path(job.submission_id);
    assert_safe_path(job.task_id);
    if (job.image.empty())
        BOOST_THROW_EXCEPTION(invalid_job() << "sandbox image of job " << job.name() << " is empty");
}

void to_json(json &j, const job_descriptor &job) {
    j = {{"submission_id", job.submission_id},
         {"task_id", job.task_id},
         {"kind", kind_name(job.kind)},
         {"image", job.image},
         {"command", job.command},
         {"input", job.input},
         {"limits", job.limits},
         {"enqueued_at", to_millis(job.enqueued_at)}};
}

void from_json(const json &j, job_message &message) {
    j.at("job").get_to(message.job);
    message.retry = retry_state{};
    assign_optional(j, message.retry.attempt, "attempt");
    int64_t not_before = 0;
    assign_optional(j, not_before, "not_before");
    message.retry.not_before = from_millis(not_before);

    if (message.retry.attempt < 1)
        BOOST_THROW_EXCEPTION(invalid_job() << "attempt of job " << message.job.name() << " must be positive");
}

void to_json(json &j, const job_message &message) {
    j = {{"job", message.job},
         {"attempt", message.retry.attempt},
         {"not_before", to_millis(message.retry.not_before)}};
}

job_message parse_job_message(const string &body) {
    try {
        return json::parse(body).get<job_message>();
    } catch (json::exception &ex) {
        BOOST_THROW_EXCEPTION(invalid_job() << "malformed job message: " << ex.what());
    }
}

}  // namespace grader

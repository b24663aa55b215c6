#include "worker.hpp"

#include <sys/prctl.h>

#include <boost/exception/diagnostic_information.hpp>

#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader {
using namespace std;
using namespace grader::server;

worker_pool::worker_pool(queue_factory factory, sandbox::sandbox &executor, result_reporter &reporter, grading_metrics &metrics, const retry_policy &policy)
    : factory(move(factory)), executor(executor), reporter(reporter), metrics(metrics), policy(policy) {}

worker_pool::~worker_pool() {
    stop();
    join();
}

void worker_pool::register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
    LOG_INFO << "Register monitor.";
}

void worker_pool::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG_ERROR << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

execution_result worker_pool::run_sandbox(const job_message &message) {
    try {
        return executor.run(message);
    } catch (std::exception &ex) {
        LOG_WARN << "Unable to launch sandbox: " << ex.what() << endl
                 << boost::diagnostic_information(ex);
        execution_result result;
        result.job = message.job.name();
        result.launch_error = ex.what();
        return result;
    }
}

void worker_pool::process(int worker_id, job_queue &queue, delivery &delivery) {
    job_message message;
    try {
        message = parse_job_message(delivery.body());
    } catch (invalid_job &ex) {
        // 格式错误的任务重试也不会成功
        LOG_ERROR << "Invalid job, moving to dead-letter queue: " << ex.what();
        call_monitor(worker_id, [&](monitor &m) { m.report_error(worker_id, ex.what()); });
        delivery.reject(/* requeue */ false);
        return;
    }

    LOG_BEGIN(message.job.name());
    defer {
        LOG_END();
    };

    if (delivery.redelivered())
        LOG_INFO << "Job redelivered at attempt " << message.retry.attempt;
    else if (message.retry.attempt == 1)
        // 发布任务的进程不暴露计数器，由评分守护进程在第一次领取时计数
        metrics.job_pushed(message.job);

    // 消息队列可能提前投递重试任务
    auto now = chrono::system_clock::now();
    if (message.retry.not_before > now)
        this_thread::sleep_for(min<chrono::system_clock::duration>(message.retry.not_before - now, policy.max_delay));

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::GRADING, message.job.name()); });
    call_monitor(worker_id, [&](monitor &m) { m.start_job(worker_id, message); });
    execution_result result = run_sandbox(message);
    call_monitor(worker_id, [&](monitor &m) { m.end_job(worker_id, message, result); });
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });

    outcome o = classify(result);
    LOG_INFO << "Attempt " << message.retry.attempt << " finished as " << outcome_name(o) << " in " << result.duration.count() << "ms";

    bool dead_letter = false;
    if (auto error = get_if<infra_error>(&o)) {
        if (!policy.exhausted(message.retry.attempt)) {
            auto delay = policy.backoff(message.retry.attempt);
            LOG_WARN << "Infrastructure error at attempt " << message.retry.attempt << ", retrying in " << delay.count() << "ms: " << error->cause;
            // 发布失败时抛出 broker_unavailable，当前投递被放回队列
            queue.publish_delayed(policy.next_attempt(message, chrono::system_clock::now()), delay);
            metrics.job_retried(message.job);
            delivery.ack();
            return;
        }

        LOG_ERROR << "Job failed " << message.retry.attempt << " attempts, giving up: " << error->cause;
        call_monitor(worker_id, [&](monitor &m) { m.report_error(worker_id, message.job.name() + ": " + error->cause); });
        dead_letter = true;
    }

    try {
        reporter.report(message, o, result);
    } catch (persistence_error &ex) {
        LOG_ERROR << "Unable to record result, requeueing: " << ex.what() << endl
                  << boost::diagnostic_information(ex);
        delivery.reject(/* requeue */ true);
        return;
    }

    if (dead_letter)
        delivery.reject(/* requeue */ false);  // 进入死信队列
    else
        delivery.ack();
}

void worker_pool::worker_loop(int worker_id) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });
    LOG_BEGIN("worker" + to_string(worker_id));
    defer {
        LOG_END();
    };

    unique_ptr<job_queue> queue;
    try {
        queue = factory(worker_id);
    } catch (std::exception &ex) {
        LOG_ERROR << "Worker " << worker_id << " is unable to connect to job queue: " << ex.what();
        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what()); });
        return;
    }

    ++workers;
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
    while (running) {
        try {
            queue->consume([&](delivery &d) { process(worker_id, *queue, d); }, running);
        } catch (std::exception &ex) {
            LOG_ERROR << "Worker " << worker_id << " lost the job queue: " << ex.what() << endl
                      << boost::diagnostic_information(ex);
            call_monitor(worker_id, [&](monitor &m) { m.report_error(worker_id, ex.what()); });
            this_thread::sleep_for(chrono::seconds(1));
        }
    }
    --workers;

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

void worker_pool::start(int count) {
    running = true;
    for (int worker_id = 0; worker_id < count; ++worker_id) {
        LOG_DEBUG << "Start worker" << worker_id;
        threads.emplace_back([this, worker_id] {
            prctl(PR_SET_NAME, ("worker" + to_string(worker_id)).c_str(), 0, 0, 0);
            worker_loop(worker_id);
        });
    }
}

void worker_pool::stop() {
    running = false;
}

void worker_pool::join() {
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
    threads.clear();
}

void worker_pool::interrupt() {
    call_monitor(-1, [&](monitor &m) { m.interrupt_jobs(); });
}

int worker_pool::running_workers() const {
    return workers;
}

}  // namespace grader

#include <signal.h>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>

#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "monitor/interrupt_monitor.hpp"
#include "monitor/prometheus.hpp"
#include "reporter.hpp"
#include "sandbox/container_sandbox.hpp"
#include "server/config.hpp"
#include "server/rabbitmq.hpp"
#include "sql/mysql_result_store.hpp"
#include "worker.hpp"
using namespace std;

static grader::worker_pool *pool = nullptr;
static int sigint = 0;

void sigintHandler(int signum) {
    if (signum == SIGINT) {
        if (sigint == 0) {
            LOG_ERROR << "Received SIGINT, stopping workers (Press Ctrl+C again to list running jobs)";
        } else if (sigint == 1) {
            LOG_ERROR << "Received SIGINT, listing running jobs (Press Ctrl+C again to terminate this app)";
        } else {
            LOG_ERROR << "Received SIGINT, terminating";
        }
    } else if (signum == SIGTERM) {
        LOG_ERROR << "Received SIGTERM, stopping workers";
    }

    if (sigint == 0) {
        if (pool) pool->stop();
    } else if (sigint == 1) {
        if (pool) pool->interrupt();
    } else {
        // 未确认的任务会被消息队列重新投递
        exit(130);
    }

    sigint++;
}

int main(int argc, char *argv[]) {
    /*** handle options ***/

    namespace po = boost::program_options;
    po::options_description desc("grading-system options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file. You can either pass it from environ CONFIG")
        ("workers", po::value<int>(), "set the number of concurrent workers, default to 1. You can either pass it from environ WORKERS")
        ("metric-addr", po::value<string>(), "set the address that Prometheus-metrics exposed, default to 0.0.0.0:9090. You can either pass it from environ METRIC_ADDR")
        ("run-dir", po::value<string>(), "set the directory to store sandbox workspaces, overrides sandbox.runDir. You can either pass it from environ RUNDIR")
        ("debug", "turn on debug logging. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "GradingSystem: Fetch grading jobs from the job queue, run them in sandboxes and record results" << endl
             << "Optional Environment Variables:" << endl
             << "\tBOOST_log_dir: directory to store rotated log files" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grading-system 1.0" << endl;
        return EXIT_SUCCESS;
    }

    bool debug = vm.count("debug") || getenv("DEBUG");
    init_logging(get_env("BOOST_log_dir"), "grader_%d_%m_%Y.%N.log", debug);

    string config_path = vm.count("config") ? vm["config"].as<string>() : get_env("CONFIG");
    if (config_path.empty()) {
        LOG_FATAL << "you must specify the configuration file by adding option --config or environ CONFIG";
        return EXIT_FAILURE;
    }

    int workers = 1;
    try {
        if (vm.count("workers")) {
            workers = vm["workers"].as<int>();
        } else if (getenv("WORKERS")) {
            workers = boost::lexical_cast<int>(getenv("WORKERS"));
        }
    } catch (boost::bad_lexical_cast &ex) {
        LOG_FATAL << "WORKERS must be a number: " << ex.what();
        return EXIT_FAILURE;
    }
    if (workers <= 0) {
        LOG_FATAL << "The number of workers must be positive";
        return EXIT_FAILURE;
    }

    grader::server::grader_config config;
    try {
        config = grader::server::load_config(config_path);
    } catch (grader::configuration_error &ex) {
        LOG_FATAL << "Unable to load configuration " << config_path << ": " << ex.what();
        return EXIT_FAILURE;
    }

    if (vm.count("run-dir")) {
        config.sandbox.run_dir = vm["run-dir"].as<string>();
    } else if (getenv("RUNDIR")) {
        config.sandbox.run_dir = getenv("RUNDIR");
    }
    error_code ec;
    filesystem::create_directories(config.sandbox.run_dir, ec);
    if (ec) {
        LOG_FATAL << "Run directory " << config.sandbox.run_dir << " cannot be created: " << ec.message();
        return EXIT_FAILURE;
    }
    LOG_DEBUG << "RUN_DIR = " << config.sandbox.run_dir;

    if (config.job_queue.concurrency != 1) {
        // 每个 worker 同时只能持有一个任务
        LOG_WARN << "jobQueue.concurrency is ignored, each worker prefetches exactly one job";
        config.job_queue.concurrency = 1;
    }

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    /*** metrics ***/

    string metric_addr = get_env("METRIC_ADDR", "0.0.0.0:9090");
    if (vm.count("metric-addr")) {
        metric_addr = vm["metric-addr"].as<string>();
    }

    auto registry = make_shared<prometheus::Registry>();
    grader::grading_metrics metrics(*registry);

    try {
        prometheus::Exposer exposer{metric_addr, 2};
        exposer.RegisterCollectable(registry);

        /*** result reporter ***/

        grader::sql::mysql_result_store store(config.db);
        grader::result_reporter reporter(store, metrics);

        unique_ptr<grader::server::rabbitmq_channel> report_channel;
        if (config.report_queue) {
            report_channel = make_unique<grader::server::rabbitmq_channel>(*config.report_queue, /* write */ true, /* dead_lettering */ false);
            reporter.on_result([&](const grader::result_record &record) {
                report_channel->report(nlohmann::json(record).dump());
            });
        }

        /*** worker ***/

        grader::sandbox::container_sandbox sandbox(config.sandbox);
        grader::worker_pool workers_pool(
            [&](int) { return make_unique<grader::server::rabbitmq_channel>(config.job_queue); },
            sandbox, reporter, metrics, config.retry);

        workers_pool.register_monitor(make_unique<grader::interrupt_monitor>());
        workers_pool.register_monitor(make_unique<grader::prometheus_monitor>(*registry));

        LOG_DEBUG << "Start working on workers";
        pool = &workers_pool;
        workers_pool.start(workers);
        LOG_INFO << "Started " << workers << " workers";

        workers_pool.join();
        pool = nullptr;
        LOG_INFO << "All workers stopped";
    } catch (std::exception &ex) {
        LOG_FATAL << "Grading system stopped unexpectedly: " << ex.what() << endl
                  << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

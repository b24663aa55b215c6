#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "logging.hpp"
#include "reporter.hpp"
#include "server/config.hpp"
#include "server/rabbitmq.hpp"
#include "sql/mysql_result_store.hpp"
#include "submitter.hpp"
using namespace std;

/**
 * 网页层调用的命令行工具
 * grader-submit --config config.json --job job.json    发布评分任务
 * grader-submit --config config.json --poll s42        以 JSON 输出某个提交的评分结果
 */
int main(int argc, char *argv[]) {
    namespace po = boost::program_options;
    po::options_description desc("grader-submit options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file. You can either pass it from environ CONFIG")
        ("job", po::value<string>(), "publish the job descriptor in the given JSON file")
        ("poll", po::value<string>(), "print results of the given submission as JSON")
        ("debug", "turn on debug logging. You can either pass it from environ DEBUG")
        ("help", "display this help text");
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

    if (vm.count("help") || (!vm.count("job") && !vm.count("poll"))) {
        cout << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    init_logging("", "", vm.count("debug") || getenv("DEBUG"));

    string config_path = vm.count("config") ? vm["config"].as<string>() : get_env("CONFIG");
    if (config_path.empty()) {
        cerr << "you must specify the configuration file by adding option --config or environ CONFIG" << endl;
        return EXIT_FAILURE;
    }

    try {
        grader::server::grader_config config = grader::server::load_config(config_path);
        auto registry = make_shared<prometheus::Registry>();
        grader::grading_metrics metrics(*registry);

        if (vm.count("job")) {
            grader::job_descriptor job;
            try {
                nlohmann::json j = nlohmann::json::parse(grader::read_file_content(vm["job"].as<string>()));
                job = j.get<grader::job_descriptor>();
                if (!grader::exists(j, "limits")) job.limits = config.sandbox.default_limits;
            } catch (nlohmann::json::exception &ex) {
                BOOST_THROW_EXCEPTION(grader::invalid_job() << "Malformed job descriptor: " << ex.what());
            }

            grader::server::rabbitmq_channel channel(config.job_queue, /* write */ true);
            grader::job_submitter submitter(channel, metrics);
            grader::job_message message = submitter.submit(move(job));
            cout << nlohmann::json(message).dump() << endl;
        }

        if (vm.count("poll")) {
            grader::sql::mysql_result_store store(config.db);
            grader::result_reporter reporter(store, metrics);
            nlohmann::json results = reporter.poll_result(vm["poll"].as<string>());
            cout << results.dump(4) << endl;
        }
    } catch (grader::broker_unavailable &ex) {
        LOG_ERROR << "Job queue is unavailable, try again later: " << ex.what();
        return 2;
    } catch (std::exception &ex) {
        LOG_ERROR << ex.what() << endl
                  << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

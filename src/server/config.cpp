#include "server/config.hpp"

#include <fstream>

#include "common/exceptions.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, login &log) {
    j.at("username").get_to(log.username);
    j.at("password").get_to(log.password);
}

void from_json(const json &j, amqp &mq) {
    j.at("exchange").get_to(mq.exchange);
    if (exists(j, "exchange_type"))
        j.at("exchange_type").get_to(mq.exchange_type);
    else
        mq.exchange_type = "direct";
    j.at("uri").get_to(mq.uri);
    j.at("queue").get_to(mq.queue);
    if (exists(j, "routing_key"))
        j.at("routing_key").get_to(mq.routing_key);
    else
        mq.routing_key = "";
    if (exists(j, "concurrency"))
        j.at("concurrency").get_to(mq.concurrency);
    else
        mq.concurrency = 1;
    if (exists(j, "retries"))
        j.at("retries").get_to(mq.retries);
    else
        mq.retries = 5;
}

void from_json(const json &j, database &db) {
    j.at("host").get_to(db.host);
    if (exists(j, "port"))
        j.at("port").get_to(db.port);
    j.at("username").get_to(db.username);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
    assign_optional(j, db.connect_timeout, "connectTimeout");
}

void from_json(const json &j, sandbox_config &config) {
    assign_optional(j, config.runtime, "runtime");
    string run_dir;
    assign_optional(j, run_dir, "runDir");
    if (!run_dir.empty()) config.run_dir = run_dir;
    assign_optional(j, config.output_limit, "outputLimit");
    assign_optional(j, config.kill_grace, "killGrace");
    assign_optional(j, config.download_timeout, "downloadTimeout");
    assign_optional(j, config.network, "network");
    assign_optional(j, config.user, "user");
    assign_optional(j, config.default_limits, "defaultLimits");
}

void from_json(const json &j, grader_config &config) {
    j.at("jobQueue").get_to(config.job_queue);
    assign_optional(j, config.report_queue, "reportQueue");
    j.at("database").get_to(config.db);
    assign_optional(j, config.sandbox, "sandbox");
    assign_optional(j, config.retry, "retry");
}

grader_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        BOOST_THROW_EXCEPTION(configuration_error() << "Configuration file " << path << " does not exist");
    try {
        ifstream fin(path);
        json config;
        fin >> config;
        return config.get<grader_config>();
    } catch (json::exception &ex) {
        BOOST_THROW_EXCEPTION(configuration_error() << "Configuration file " << path << " is malformed: " << ex.what());
    } catch (invalid_job &ex) {
        BOOST_THROW_EXCEPTION(configuration_error() << "Configuration file " << path << " has invalid default limits: " << ex.what());
    }
}

}  // namespace grader::server

#include "sql/mysql_result_store.hpp"

#include <fmt/core.h>

#include <boost/lexical_cast.hpp>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::sql {
using namespace std;

static const char *const CREATE_TABLE = R"(CREATE TABLE IF NOT EXISTS grading_results (
    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
    submission_id VARCHAR(128) NOT NULL,
    task_id VARCHAR(128) NOT NULL,
    kind VARCHAR(16) NOT NULL,
    outcome VARCHAR(16) NOT NULL,
    reason TEXT NOT NULL,
    exit_code INT NOT NULL,
    stdout MEDIUMBLOB NOT NULL,
    stderr MEDIUMBLOB NOT NULL,
    truncated TINYINT(1) NOT NULL,
    duration_ms BIGINT NOT NULL,
    attempt INT NOT NULL,
    created_at BIGINT NOT NULL,
    UNIQUE KEY uniq_result (submission_id, task_id, kind)
) DEFAULT CHARSET=utf8mb4)";

mysql_result_store::mysql_result_store(const server::database &dbcfg) : dbcfg(dbcfg) {
    scoped_lock guard(mut);
    connect();
    try {
        execute(CREATE_TABLE);
    } catch (...) {
        mysql_close(con);
        throw;
    }
}

mysql_result_store::~mysql_result_store() {
    if (con) mysql_close(con);
}

void mysql_result_store::connect() {
    if (con) mysql_close(con);
    con = mysql_init(nullptr);
    if (!con) BOOST_THROW_EXCEPTION(persistence_error() << "mysql_init failed");

    unsigned int timeout = dbcfg.connect_timeout;
    if (mysql_options(con, MYSQL_OPT_CONNECT_TIMEOUT, &timeout) != 0)
        BOOST_THROW_EXCEPTION(persistence_error() << "Unable to set connect timeout: " << mysql_error(con));
    mysql_options(con, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    if (mysql_real_connect(con, dbcfg.host.c_str(), dbcfg.username.c_str(), dbcfg.password.c_str(), dbcfg.database.c_str(), dbcfg.port, nullptr, 0) == nullptr) {
        string error = mysql_error(con);
        mysql_close(con);
        con = nullptr;
        BOOST_THROW_EXCEPTION(persistence_error() << "Unable to connect to database " << dbcfg.host << ":" << dbcfg.port << "/" << dbcfg.database << ": " << error);
    }
    LOG_INFO << "Connected to database " << dbcfg.host << ":" << dbcfg.port << "/" << dbcfg.database;
}

void mysql_result_store::ensure_connected() {
    if (con && mysql_ping(con) == 0) return;
    LOG_WARN << "Database connection lost, reconnecting";
    connect();
}

void mysql_result_store::execute(const string &sql) {
    if (mysql_real_query(con, sql.data(), sql.size()) != 0)
        BOOST_THROW_EXCEPTION(persistence_error() << "Query failed: " << mysql_error(con));
}

string mysql_result_store::escape(const string &value) {
    string buffer(value.size() * 2 + 1, '\0');
    unsigned long length = mysql_real_escape_string(con, &buffer[0], value.data(), value.size());
    buffer.resize(length);
    return buffer;
}

bool mysql_result_store::save(const result_record &record) {
    scoped_lock guard(mut);
    ensure_connected();

    string sql = fmt::format(
        "INSERT IGNORE INTO grading_results "
        "(submission_id, task_id, kind, outcome, reason, exit_code, stdout, stderr, truncated, duration_ms, attempt, created_at) "
        "VALUES ('{}', '{}', '{}', '{}', '{}', {}, '{}', '{}', {}, {}, {}, {})",
        escape(record.submission_id), escape(record.task_id), escape(kind_name(record.kind)),
        escape(record.outcome), escape(ensure_utf8(record.reason)), record.exit_code,
        escape(record.output), escape(record.error), record.truncated ? 1 : 0,
        record.duration.count(), record.attempt,
        chrono::duration_cast<chrono::milliseconds>(record.created_at.time_since_epoch()).count());
    execute(sql);

    // 唯一索引冲突时 INSERT IGNORE 不插入任何行
    return mysql_affected_rows(con) > 0;
}

vector<result_record> mysql_result_store::find(const string &submission_id) {
    scoped_lock guard(mut);
    ensure_connected();

    execute(fmt::format(
        "SELECT submission_id, task_id, kind, outcome, reason, exit_code, stdout, stderr, truncated, duration_ms, attempt, created_at "
        "FROM grading_results WHERE submission_id = '{}' ORDER BY task_id, kind",
        escape(submission_id)));

    MYSQL_RES *res = mysql_store_result(con);
    if (!res) BOOST_THROW_EXCEPTION(persistence_error() << "Unable to read results: " << mysql_error(con));

    vector<result_record> records;
    try {
        MYSQL_ROW row;
        while ((row = mysql_fetch_row(res))) {
            unsigned long *lengths = mysql_fetch_lengths(res);
            auto column = [&](int i) { return row[i] ? string(row[i], lengths[i]) : string(); };

            result_record record;
            record.submission_id = column(0);
            record.task_id = column(1);
            record.kind = parse_test_kind(column(2));
            record.outcome = column(3);
            record.reason = column(4);
            record.exit_code = boost::lexical_cast<int>(column(5));
            record.output = column(6);
            record.error = column(7);
            record.truncated = column(8) != "0";
            record.duration = chrono::milliseconds(boost::lexical_cast<int64_t>(column(9)));
            record.attempt = boost::lexical_cast<int>(column(10));
            record.created_at = chrono::system_clock::time_point(chrono::milliseconds(boost::lexical_cast<int64_t>(column(11))));
            records.push_back(move(record));
        }
    } catch (std::exception &ex) {
        mysql_free_result(res);
        BOOST_THROW_EXCEPTION(persistence_error() << "Malformed result row for " << submission_id << ": " << ex.what());
    }
    mysql_free_result(res);
    return records;
}

}  // namespace grader::sql

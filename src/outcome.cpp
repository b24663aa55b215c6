#include "outcome.hpp"

#include <fmt/core.h>

#include <boost/algorithm/string/trim.hpp>

#include "common/io_utils.hpp"

namespace grader {
using namespace std;

// 诊断信息最多保留的字符数
static constexpr size_t MAX_REASON_LENGTH = 256;

/**
 * @brief 取最后一行非空输出作为诊断信息，测试脚本一般在最后输出失败的断言
 */
static string last_line(string text) {
    auto marker = text.rfind(TRUNCATED_MARKER);
    if (marker != string::npos) text.erase(marker);
    boost::algorithm::trim_right(text);
    auto pos = text.find_last_of('\n');
    string line = pos == string::npos ? text : text.substr(pos + 1);
    boost::algorithm::trim(line);
    if (line.size() > MAX_REASON_LENGTH) line = line.substr(0, MAX_REASON_LENGTH) + "...";
    return line;
}

static string failure_reason(const execution_result &result) {
    string reason;
    if (result.exitcode < 0)
        reason = "program terminated abnormally";
    else if (result.exitcode == 137)  // 128 + SIGKILL，一般是内存超限被内核杀死
        reason = "exit code 137 (killed, possibly out of memory)";
    else if (result.exitcode > 128)
        reason = fmt::format("exit code {} (signal {})", result.exitcode, result.exitcode - 128);
    else
        reason = fmt::format("exit code {}", result.exitcode);

    string detail = last_line(result.error);
    if (detail.empty()) detail = last_line(result.output);
    if (!detail.empty()) reason += ": " + detail;
    return reason;
}

outcome classify(const execution_result &result) {
    if (result.launch_error)
        return infra_error{*result.launch_error};
    if (result.timed_out)
        return timed_out{};
    if (result.exitcode == 0)
        return passed{};
    return failed{failure_reason(result)};
}

string outcome_name(const outcome &o) {
    return visit(overloaded{
                     [](const passed &) { return "passed"; },
                     [](const failed &) { return "failed"; },
                     [](const timed_out &) { return "timed_out"; },
                     [](const infra_error &) { return "infra_error"; },
                 },
                 o);
}

string outcome_detail(const outcome &o) {
    return visit(overloaded{
                     [](const passed &) { return string(); },
                     [](const failed &f) { return f.reason; },
                     [](const timed_out &) { return string("time limit exceeded"); },
                     [](const infra_error &e) { return e.cause; },
                 },
                 o);
}

bool student_visible(const outcome &o) {
    return !holds_alternative<infra_error>(o);
}

}  // namespace grader

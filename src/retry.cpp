#include "retry.hpp"

#include "common/exceptions.hpp"

namespace grader {
using namespace std;

bool retry_policy::exhausted(int attempt) const noexcept {
    return attempt > max_attempts;
}

chrono::milliseconds retry_policy::backoff(int attempt) const noexcept {
    auto delay = base_delay;
    for (int i = 1; i < attempt && delay < max_delay; ++i)
        delay *= 2;
    return min(delay, max_delay);
}

job_message retry_policy::next_attempt(const job_message &message, chrono::system_clock::time_point now) const {
    job_message next = message;
    next.retry.not_before = now + backoff(message.retry.attempt);
    next.retry.attempt = message.retry.attempt + 1;
    return next;
}

void from_json(const nlohmann::json &j, retry_policy &policy) {
    assign_optional(j, policy.max_attempts, "maxAttempts");
    long base_delay = policy.base_delay.count(), max_delay = policy.max_delay.count();
    assign_optional(j, base_delay, "baseDelayMs");
    assign_optional(j, max_delay, "maxDelayMs");
    policy.base_delay = chrono::milliseconds(base_delay);
    policy.max_delay = chrono::milliseconds(max_delay);

    if (policy.max_attempts < 1)
        BOOST_THROW_EXCEPTION(configuration_error() << "retry.maxAttempts must be at least 1");
    if (policy.base_delay.count() < 0 || policy.max_delay < policy.base_delay)
        BOOST_THROW_EXCEPTION(configuration_error() << "retry delays are invalid");
}

}  // namespace grader

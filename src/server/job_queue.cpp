#include "server/job_queue.hpp"

#include <boost/exception/diagnostic_information.hpp>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::server {
using namespace std;

delivery::~delivery() {}

void delivery::ack() {
    if (done) BOOST_THROW_EXCEPTION(grader_exception() << "delivery has already been settled");
    do_ack();
    done = true;
}

void delivery::reject(bool requeue) {
    if (done) BOOST_THROW_EXCEPTION(grader_exception() << "delivery has already been settled");
    do_reject(requeue);
    done = true;
}

bool delivery::settled() const noexcept {
    return done;
}

job_queue::~job_queue() {}

void job_queue::consume(const function<void(delivery &)> &handler, const atomic<bool> &running, chrono::milliseconds poll_interval) {
    while (running) {
        unique_ptr<delivery> envelope = fetch(poll_interval);
        if (!envelope) continue;

        try {
            handler(*envelope);
        } catch (std::exception &ex) {
            LOG_ERROR << "Unable to handle delivery: " << ex.what() << endl
                      << boost::diagnostic_information(ex);
            if (!envelope->settled()) envelope->reject(/* requeue */ true);
            continue;
        }

        if (!envelope->settled()) {
            LOG_WARN << "Handler left delivery unsettled, requeueing";
            envelope->reject(/* requeue */ true);
        }
    }
}

}  // namespace grader::server

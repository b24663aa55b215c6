#include "common/net_utils.hpp"

#include <cpr/cpr.h>

#include <fstream>

#include "common/exceptions.hpp"

namespace grader::net {
using namespace std;

void download_file(const string &url, const filesystem::path &path, const double connect_timeout) {
    filesystem::create_directories(path.parent_path());
    std::ofstream destination(path, ios::binary);
    cpr::Response resp = cpr::Download(
        destination,
        cpr::Url{url},
        cpr::Timeout{static_cast<int>(connect_timeout * 1000)});

    if (resp.status_code == 0) {
        BOOST_THROW_EXCEPTION(network_error() << "unable to download file from " << url << ", error=" << resp.error.message);
    }

    if (resp.status_code >= 400) {
        BOOST_THROW_EXCEPTION(network_error() << "unable to download file from " << url << ", status code=" << resp.status_code);
    }
}

}  // namespace grader::net

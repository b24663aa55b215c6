#include "common/exceptions.hpp"

namespace grader {
using namespace std;

grader_exception::grader_exception() noexcept {}

grader_exception::grader_exception(const string &what) noexcept : message(what) {}

grader_exception::grader_exception(const grader_exception &other) : boost::exception(other), std::exception(other), message(other.message) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

}  // namespace grader

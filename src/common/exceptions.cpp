#include "runbox/common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>
#include <cerrno>
#include <cstring>

namespace runbox {
using namespace std;

sandbox_exception::sandbox_exception()
    : sandbox_exception("") {}

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

config_error::config_error(const string &message)
    : sandbox_exception(message) {}

internal_error::internal_error(const string &message)
    : sandbox_exception(message) {}

violation::violation(status code, const string &message)
    : sandbox_exception(message), code(code) {}

violation::violation(status code, const string &message, int signal)
    : sandbox_exception(message), code(code), signal(signal) {}

internal_error system_failure(const string &what) {
    return internal_error(fmt::format("{}: {}", what, strerror(errno)));
}

}  // namespace runbox

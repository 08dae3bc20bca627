#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include "runbox/common/status.hpp"

namespace runbox {

struct sandbox_exception : std::exception {
    sandbox_exception();
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief Malformed command line or rule override.
 * Raised before any child process exists.
 */
struct config_error : public sandbox_exception {
    explicit config_error(const std::string &message);
};

/**
 * @brief A fault of the sandbox itself: failed system calls of the
 * supervisor, lost track of the traced process, broken syscall entry/exit
 * pairing and the like. Always reported as status XX.
 */
struct internal_error : public sandbox_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief The sandboxed program did something that ends the run.
 * Carries the status to report and, for signal outcomes, the signal number.
 */
struct violation : public sandbox_exception {
    violation(status code, const std::string &message);
    violation(status code, const std::string &message, int signal);

    status code;
    std::optional<int> signal;
};

/**
 * @brief Builds an internal_error from the current errno.
 */
internal_error system_failure(const std::string &what);

}  // namespace runbox

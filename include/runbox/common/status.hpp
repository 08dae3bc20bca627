#pragma once

namespace runbox {

/**
 * @brief Terminal outcome of one sandboxed run
 */
enum class status {
    /**
     * @brief The program exited with status 0 within all limits
     */
    OK = 0,

    /**
     * @brief The program exited with a non-zero status
     */
    RUNTIME_ERROR = 1,

    /**
     * @brief The program was ended by a signal: a fatal signal it received,
     * a breakpoint, SIGXCPU or SIGXFSZ, or an interrupt of the sandbox.
     */
    SIGNALED = 2,

    /**
     * @brief The program signalled itself with kill or tgkill.
     * Shares the SG code with SIGNALED on the wire, the message tells them apart.
     */
    SELF_SIGNALED = 3,

    /**
     * @brief CPU time or wall clock time limit exceeded
     */
    TIMEOUT = 4,

    /**
     * @brief A syscall denied by the syscall rules
     */
    FORBIDDEN_SYSCALL = 5,

    /**
     * @brief A path rejected by the path rules
     */
    FORBIDDEN_FILE = 6,

    /**
     * @brief The sandbox itself failed
     */
    INTERNAL_ERROR = 7
};

/**
 * @brief Two-letter code written to the report ("OK", "RE", "SG", "TO", "FO", "FA", "XX")
 */
const char *status_code(status);

/**
 * @brief Exit code of the sandbox for the given outcome: 0, 1 or 2
 */
int exit_code_of(status);

}  // namespace runbox

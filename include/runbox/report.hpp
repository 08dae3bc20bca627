#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include "runbox/common/status.hpp"

namespace runbox {

/**
 * @brief Outcome of one sandboxed run
 */
struct run_report {
    /**
     * @brief CPU time (user + system) in ms
     */
    long cpu_time = 0;

    /**
     * @brief Wall clock time in ms
     */
    long wall_time = 0;

    /**
     * @brief Peak virtual memory in bytes
     */
    uint64_t memory = 0;

    status result = status::OK;
    std::string message;

    std::optional<int> exitcode;
    std::optional<int> exitsig;

    /**
     * @brief The sandbox killed the program
     */
    bool killed = false;

    /**
     * @brief Syscalls the program made after exec that were checked and allowed
     */
    int syscall_count = 0;
};

/**
 * @brief Writes the report as "key:value" lines.
 * time, time-wall, mem, then exitcode, exitsig and killed when present,
 * then status and message.
 */
void write_report(std::ostream &os, const run_report &report);

/**
 * @brief One line for humans, e.g. "OK (0.004 sec real, 0.010 sec wall, 1 MB, 37 syscalls)"
 * or the message of a failed run.
 */
std::string summary_line(const run_report &report);

/**
 * @brief Destination of the report: a file, standard output for "-", or
 * nowhere when no path is given.
 */
class report_sink {
public:
    report_sink() = default;

    /**
     * @throw config_error if the file cannot be created
     */
    explicit report_sink(const std::string &path);

    /**
     * @brief Writes the report, flushes it and closes the sink.
     * The summary line always goes to standard error.
     */
    void emit(const run_report &report);

private:
    std::ofstream file;
    std::ostream *out = nullptr;
};

}  // namespace runbox

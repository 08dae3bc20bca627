#pragma once

#include <sys/resource.h>
#include <string>
#include <vector>
#include "runbox/options.hpp"

namespace runbox {

void set_rlimit(int resource, rlim_t cur, rlim_t max);

/**
 * @brief Marks every descriptor above stderr close-on-exec, so files the
 * supervisor holds open (the report sink among them) never reach the command
 */
void close_inherited_fds();

/**
 * @brief Limits resources of the current process and redirects its streams.
 * 1. change the working directory if requested
 * 2. redirect stdin, stdout and stderr; stderr defaults to stdout
 * 3. move to a process group of its own, so the whole group can be killed
 * 4. limit address space and stack size
 * 5. mark inherited descriptors close-on-exec and limit the number of open files
 */
void set_restrictions(const runbox_options &opt);

/**
 * @brief Body of the forked child, it never returns.
 * Applies the restrictions, asks to be traced when filtering syscalls and
 * stops itself until the supervisor is ready, then executes the command.
 * Any failure is written to error_fd, a close-on-exec pipe to the supervisor,
 * before exiting.
 */
[[noreturn]] void run_child(const runbox_options &opt, const std::vector<std::string> &env, int error_fd);

}  // namespace runbox

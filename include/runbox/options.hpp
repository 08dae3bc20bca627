#pragma once

#include <optional>
#include <string>
#include <vector>

namespace runbox {

/**
 * @brief Parameters of one sandboxed run.
 * Filled once from the command line, read-only afterwards.
 */
struct runbox_options {
    std::optional<long> cpu_limit;   // CPU time limit in ms
    std::optional<long> wall_limit;  // wall clock limit in ms

    /**
     * @brief Grace period in ms.
     * A program over its CPU limit is not killed while its CPU time is still
     * below this value, so that its real execution time can be reported.
     */
    long extra_time = 0;

    std::optional<long> memory_limit;  // address space limit in KB
    long stack_limit = 0;              // stack limit in KB, 0 means unlimited

    /**
     * @brief File access level, 0 to 9, each level permits more.
     * 0: nothing, 1: only user path rules, 2: and the current directory,
     * 3: and the built-in system paths, 4: the whole filesystem, 9: no checks at all.
     */
    int file_access = 0;

    /**
     * @brief 0: no syscall filtering, the program is not even traced,
     * 1: liberal allow-list, 2: strict allow-list.
     */
    int filter_syscalls = 0;

    int verbose = 0;

    std::string work_dir;
    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool pass_environ = false;

    std::string metafile_path;
    std::vector<std::string> command;
};

}  // namespace runbox

#pragma once

#include <sys/types.h>
#include <cstdint>
#include <string>

namespace runbox {

/**
 * @brief utime + stime in clock ticks from the content of /proc/<pid>/stat
 * @throw internal_error on a malformed line
 */
long parse_stat_cpu_ticks(const std::string &stat);

/**
 * @brief VmPeak in KB from the content of /proc/<pid>/status, -1 if absent
 */
long parse_vm_peak(const std::string &status);

/**
 * @brief Process accounting of the sandboxed process through its /proc files.
 * The files are opened on first use and kept open for the whole run.
 */
class proc_monitor {
public:
    explicit proc_monitor(pid_t pid);
    ~proc_monitor();

    proc_monitor(const proc_monitor &) = delete;
    proc_monitor &operator=(const proc_monitor &) = delete;

    /**
     * @brief CPU time (user + system) consumed so far, in ms
     */
    long cpu_time();

    /**
     * @brief Records VmPeak if it is higher than anything seen before.
     * The kernel forgets the peak when the process exits, so this has to be
     * called whenever the process may be about to end.
     */
    void sample_mem_peak();

    /**
     * @brief Highest VmPeak seen, in KB
     */
    long mem_peak() const;

private:
    std::string read_proc_file(const char *name, int &fd);

    pid_t pid;
    long ticks_per_sec;
    int stat_fd = -1;
    int status_fd = -1;
    long mem_peak_kb = 0;
};

}  // namespace runbox

#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include "runbox/options.hpp"
#include "runbox/path_check.hpp"
#include "runbox/policy.hpp"
#include "runbox/policy_config.hpp"
#include "runbox/proc.hpp"
#include "runbox/report.hpp"
#include "runbox/tracee.hpp"

namespace runbox {

/**
 * @brief Runs the command of the options in a traced child process and
 * watches it until it ends.
 *
 * 1. build the environment and fork; the child restricts itself, asks to be
 *    traced and stops until the supervisor is ready (see run_child)
 * 2. install a one second interval timer if any time limit is set, and
 *    SIGINT/SIGTERM handlers; the handlers only set flags for the loop
 * 3. wait for state changes of the child:
 *    1. syscall stops alternate between entry and exit; syscalls before the
 *       first execve belong to the sandbox and are not checked, later ones
 *       are decided by the syscall policy and path validator, and a denied
 *       syscall is replaced by an invalid one before the run is ended
 *    2. other signals are passed on to the child, SIGXCPU and SIGXFSZ end
 *       the run
 *    3. on each timer tick, CPU and wall time are compared with the limits
 * 4. on exit or fatal signal, or when the run is ended early, kill the
 *    child's process group, wait for it and collect the final statistics
 */
class supervisor {
public:
    supervisor(const runbox_options &opt, const policy_config &config);
    ~supervisor();

    supervisor(const supervisor &) = delete;
    supervisor &operator=(const supervisor &) = delete;

    /**
     * @brief Runs the command, every outcome ends up in the returned report
     */
    run_report run();

private:
    void start_child();
    void trace_loop();
    void check_timeout();
    void on_stop(int sig);
    void on_syscall_entry();
    void on_syscall_exit();
    void neutralize(syscall_frame &frame);
    void on_exited(int exitcode);
    void check_bootstrap_error();
    void terminate_child();
    void final_stats(const struct rusage &rus);
    long elapsed_wall_time() const;

    const runbox_options &opt;
    const policy_config &config;
    path_validator validator;

    pid_t box_pid = 0;
    int error_fd = -1;
    std::unique_ptr<tracee> traced;
    std::unique_ptr<proc_monitor> monitor;
    std::unique_ptr<syscall_policy> policy;
    std::chrono::steady_clock::time_point start_time;

    bool exec_seen = false;
    unsigned trap_count = 0;
    unsigned sys_tick = 0;
    uint64_t last_sys = 0;
    syscall_rule last_rule;
    int syscall_count = 0;

    run_report report;
};

}  // namespace runbox

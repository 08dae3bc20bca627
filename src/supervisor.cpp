#include "runbox/supervisor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include "runbox/child.hpp"
#include "runbox/common/defer.hpp"
#include "runbox/common/exceptions.hpp"
#include "runbox/env.hpp"

namespace runbox {
using namespace std;

static volatile sig_atomic_t timer_tick = 0;
static volatile sig_atomic_t interrupt_signal = 0;

static void signal_alarm(int) {
    timer_tick = 1;
}

static void signal_int(int sig) {
    interrupt_signal = sig;
}

static long timeval_ms(const struct timeval &tv) {
    return tv.tv_sec * 1000L + tv.tv_usec / 1000;
}

supervisor::supervisor(const runbox_options &opt, const policy_config &config)
    : opt(opt), config(config), validator(config, opt.file_access) {
    syscall_count = opt.filter_syscalls ? 0 : 1;
}

supervisor::~supervisor() {
    if (error_fd >= 0) close(error_fd);
}

long supervisor::elapsed_wall_time() const {
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start_time).count();
}

void supervisor::start_child() {
    vector<string> env = setup_environment(config.env_rules(), opt.pass_environ, current_environment());

    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0)
        throw system_failure("pipe2");

    box_pid = fork();
    if (box_pid < 0) {
        box_pid = 0;
        close(fds[0]);
        close(fds[1]);
        throw system_failure("fork");
    }
    if (box_pid == 0)
        run_child(opt, env, fds[1]);

    close(fds[1]);
    error_fd = fds[0];
    start_time = chrono::steady_clock::now();
    VLOG(1) << "Started sandboxed process " << box_pid;

    traced = make_unique<tracee>(box_pid);
    monitor = make_unique<proc_monitor>(box_pid);
    policy = make_unique<syscall_policy>(config, opt.filter_syscalls, box_pid);
}

run_report supervisor::run() {
    timer_tick = 0;
    interrupt_signal = 0;

    try {
        struct sigaction sa = {}, old_alrm, old_int, old_term;
        sa.sa_handler = signal_int;
        sigaction(SIGINT, &sa, &old_int);
        sigaction(SIGTERM, &sa, &old_term);
        sa.sa_handler = signal_alarm;
        sigaction(SIGALRM, &sa, &old_alrm);

        bool use_timer = opt.cpu_limit || opt.wall_limit;
        defer {
            if (use_timer) {
                struct itimerval timer = {};
                setitimer(ITIMER_REAL, &timer, nullptr);
            }
            sigaction(SIGALRM, &old_alrm, nullptr);
            sigaction(SIGTERM, &old_term, nullptr);
            sigaction(SIGINT, &old_int, nullptr);
        };

        start_child();

        if (use_timer) {
            struct itimerval timer = {};
            timer.it_interval.tv_sec = timer.it_value.tv_sec = 1;
            if (setitimer(ITIMER_REAL, &timer, nullptr) < 0)
                throw system_failure("setitimer");
        }

        trace_loop();
    } catch (violation &ex) {
        VLOG(1) << "Run ended: " << ex.what();
        report.result = ex.code;
        report.message = ex.what();
        if (ex.signal) report.exitsig = *ex.signal;
    } catch (sandbox_exception &ex) {
        LOG(ERROR) << ex;
        report.result = status::INTERNAL_ERROR;
        report.message = ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unexpected exception: " << ex.what();
        report.result = status::INTERNAL_ERROR;
        report.message = ex.what();
    }

    if (box_pid > 0)
        terminate_child();

    report.syscall_count = syscall_count;
    return report;
}

void supervisor::trace_loop() {
    for (;;) {
        if (interrupt_signal)
            throw violation(status::SIGNALED, "Interrupted", (int)interrupt_signal);
        if (timer_tick) {
            timer_tick = 0;
            check_timeout();
        }

        int stat;
        struct rusage rus;
        pid_t p = wait4(box_pid, &stat, WUNTRACED, &rus);
        if (p < 0) {
            if (errno == EINTR) continue;
            throw system_failure("wait4");
        }
        if (p != box_pid)
            throw internal_error(fmt::format("wait4: unknown pid {} exited!", p));
        VLOG(3) << fmt::format("[wait status {:08x}]", stat);

        if (WIFEXITED(stat)) {
            box_pid = 0;
            final_stats(rus);
            check_bootstrap_error();
            on_exited(WEXITSTATUS(stat));
            return;
        }
        if (WIFSIGNALED(stat)) {
            box_pid = 0;
            int sig = WTERMSIG(stat);
            report.exitsig = sig;
            final_stats(rus);
            check_bootstrap_error();
            throw violation(status::SIGNALED,
                            fmt::format("Caught fatal signal {}{}", sig, syscall_count ? "" : " during startup"),
                            sig);
        }
        if (WIFSTOPPED(stat)) {
            on_stop(WSTOPSIG(stat));
            continue;
        }
        throw internal_error(fmt::format("wait4: unknown status {:x}, giving up!", stat));
    }
}

void supervisor::on_exited(int exitcode) {
    if (exitcode) {
        report.exitcode = exitcode;
        throw violation(status::RUNTIME_ERROR, fmt::format("Exited with error status {}", exitcode));
    }
    if (opt.cpu_limit && report.cpu_time > *opt.cpu_limit)
        throw violation(status::TIMEOUT, "Time limit exceeded");
    if (opt.wall_limit && report.wall_time > *opt.wall_limit)
        throw violation(status::TIMEOUT, "Time limit exceeded (wall clock)");
    report.result = status::OK;
}

void supervisor::check_bootstrap_error() {
    if (error_fd < 0) return;

    char buf[1024];
    ssize_t n = read(error_fd, buf, sizeof(buf));
    close(error_fd);
    error_fd = -1;
    if (n > 0)
        throw internal_error(string(buf, n));
}

void supervisor::check_timeout() {
    if (opt.wall_limit) {
        long wall = elapsed_wall_time();
        if (wall > *opt.wall_limit)
            throw violation(status::TIMEOUT, "Time limit exceeded (wall clock)");
        VLOG(2) << "[wall time check: " << wall << " msec]";
    }
    if (opt.cpu_limit) {
        long ms = monitor->cpu_time();
        if (ms > *opt.cpu_limit && ms > opt.extra_time)
            throw violation(status::TIMEOUT, "Time limit exceeded");
    }
}

void supervisor::on_stop(int sig) {
    if (!opt.filter_syscalls) {
        VLOG(1) << ">> Untraced process stopped by signal " << sig;
        return;
    }

    if (sig == (SIGTRAP | 0x80)) {
        if (++sys_tick & 1)
            on_syscall_entry();
        else
            on_syscall_exit();
        traced->resume();
    } else if (sig == SIGSTOP) {
        VLOG(1) << ">> SIGSTOP";
        traced->set_options();
        traced->resume();
    } else if (sig == SIGTRAP) {
        if (trap_count++)
            throw violation(status::SIGNALED, "Breakpoint", sig);
        VLOG(1) << ">> Traceme request caught";
        traced->resume();
    } else if (sig == SIGXCPU || sig == SIGXFSZ) {
        throw violation(status::SIGNALED, fmt::format("Received signal {}", sig), sig);
    } else {
        VLOG(1) << ">> Signal " << sig;
        monitor->sample_mem_peak();
        traced->resume(sig);
    }
}

void supervisor::neutralize(syscall_frame &frame) {
    frame.args.nr = invalid_syscall_nr;
    traced->write_registers(frame);
}

void supervisor::on_syscall_entry() {
    syscall_frame frame = traced->read_registers(false);
    uint64_t nr = frame.args.nr;

    if (frame.mode != call_mode::NATIVE_64) {
        neutralize(frame);
        throw violation(status::FORBIDDEN_SYSCALL, "Forbidden 32-bit mode syscall " + describe_native(nr));
    }

    VLOG(1) << fmt::format(">> Syscall {:<12} ({:08x},{:08x},{:08x})", describe_native(nr),
                           frame.args.arg1, frame.args.arg2, frame.args.arg3);

    if (!exec_seen) {
        // The sandbox's own code between fork and exec
        VLOG(1) << "[master]";
        last_rule = syscall_rule();
        last_rule.act = action::ALLOW;
        last_rule.no_retval = nr == to_native(sys::rt_sigreturn);
        last_sys = nr;
        return;
    }

    decision d = policy->decide(frame.args);
    switch (d.result) {
        case verdict::ALLOW_IF_PATH:
            try {
                validator.validate(*traced, d.path_addr);
            } catch (violation &) {
                neutralize(frame);
                throw;
            }
            [[fallthrough]];
        case verdict::ALLOW:
            last_rule = d.rule;
            syscall_count++;
            if (d.rule.sample_mem)
                monitor->sample_mem_peak();
            break;
        case verdict::SELF_SIGNAL:
            neutralize(frame);
            throw violation(status::SELF_SIGNALED, fmt::format("Committed suicide by signal {}", d.signal), d.signal);
        case verdict::DENY:
            neutralize(frame);
            throw violation(status::FORBIDDEN_SYSCALL, "Forbidden syscall " + describe_native(nr));
    }
    last_sys = nr;
}

void supervisor::on_syscall_exit() {
    syscall_frame frame = traced->read_registers(true);
    uint64_t nr = frame.args.nr;

    if (nr == invalid_syscall_nr) {
        if (!last_rule.no_retval)
            throw internal_error("Syscall does not return, but it should");
    } else if (nr != last_sys) {
        throw internal_error("Mismatched syscall entry/exit");
    }

    if (last_rule.no_retval)
        VLOG(1) << "= ?";
    else
        VLOG(1) << "= " << frame.result;

    // Enforcement starts once the command image is running, a failed
    // execve leaves the sandbox's own code in control
    if (!exec_seen && nr == to_native(sys::execve) && frame.result == 0) {
        exec_seen = true;
        traced->exec_done();
    }
}

void supervisor::terminate_child() {
    try {
        if (monitor) monitor->sample_mem_peak();
    } catch (sandbox_exception &ex) {
        LOG(WARNING) << "Cannot sample memory of the dying process: " << ex.what();
    }

    kill(-box_pid, SIGKILL);
    kill(box_pid, SIGKILL);
    report.killed = true;

    int stat;
    struct rusage rus;
    for (;;) {
        pid_t p = wait4(box_pid, &stat, 0, &rus);
        if (p < 0) {
            if (errno == EINTR) continue;
            LOG(ERROR) << "Lost track of the sandboxed process " << box_pid << ": " << strerror(errno);
            report.result = status::INTERNAL_ERROR;
            report.message = "Lost track of the process";
            box_pid = 0;
            report.wall_time = elapsed_wall_time();
            if (monitor) report.memory = (uint64_t)monitor->mem_peak() * 1024;
            return;
        }
        if (WIFEXITED(stat) || WIFSIGNALED(stat)) break;
    }
    box_pid = 0;
    final_stats(rus);
}

void supervisor::final_stats(const struct rusage &rus) {
    report.cpu_time = timeval_ms(rus.ru_utime) + timeval_ms(rus.ru_stime);
    report.wall_time = elapsed_wall_time();
    if (monitor) report.memory = (uint64_t)monitor->mem_peak() * 1024;
}

}  // namespace runbox

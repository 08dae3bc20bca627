#include "runbox/policy_config.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;

namespace {

enum rule_flags : unsigned {
    YES = 1,
    FILE_ARG1 = 2,
    FILE_ARG2 = 4,
    NO_RETVAL = 8,
    SAMPLE_MEM = 16,
    LIBERAL = 32
};

struct default_rule {
    sys id;
    unsigned flags;
};

const default_rule default_syscall_rules[] = {
    // Syscalls permitted for specific file names
    {sys::open, FILE_ARG1},
    {sys::creat, FILE_ARG1},
    {sys::unlink, FILE_ARG1},
    {sys::access, FILE_ARG1},
    {sys::truncate, FILE_ARG1},
    {sys::stat, FILE_ARG1},
    {sys::lstat, FILE_ARG1},
    {sys::readlink, FILE_ARG1},
    {sys::openat, FILE_ARG2},
    {sys::newfstatat, FILE_ARG2},
    {sys::faccessat, FILE_ARG2},
    {sys::faccessat2, FILE_ARG2},
    {sys::readlinkat, FILE_ARG2},
    {sys::unlinkat, FILE_ARG2},
    {sys::statx, FILE_ARG2},

    // Syscalls permitted always
    {sys::exit, YES | SAMPLE_MEM},
    {sys::read, YES},
    {sys::write, YES},
    {sys::close, YES},
    {sys::lseek, YES},
    {sys::getpid, YES},
    {sys::getuid, YES},
    {sys::dup, YES},
    {sys::brk, YES},
    {sys::getgid, YES},
    {sys::geteuid, YES},
    {sys::getegid, YES},
    {sys::dup2, YES},
    {sys::dup3, YES},
    {sys::ftruncate, YES},
    {sys::fstat, YES},
    {sys::personality, YES},
    {sys::readv, YES},
    {sys::writev, YES},
    {sys::getresuid, YES},
    {sys::getresgid, YES},
    {sys::pread64, YES},
    {sys::pwrite64, YES},
    {sys::fcntl, YES},
    {sys::mmap, YES},
    {sys::munmap, YES},
    {sys::ioctl, YES},
    {sys::uname, YES},
    {sys::gettid, YES},
    {sys::set_thread_area, YES},
    {sys::get_thread_area, YES},
    {sys::set_tid_address, YES},
    {sys::set_robust_list, YES},
    {sys::arch_prctl, YES},
    {sys::exit_group, YES | SAMPLE_MEM},

    // Syscalls permitted only in liberal mode
    {sys::time, YES | LIBERAL},
    {sys::alarm, YES | LIBERAL},
    {sys::pause, YES | LIBERAL},
    {sys::fchmod, YES | LIBERAL},
    {sys::getrlimit, YES | LIBERAL},
    {sys::prlimit64, YES | LIBERAL},
    {sys::getrusage, YES | LIBERAL},
    {sys::gettimeofday, YES | LIBERAL},
    {sys::clock_gettime, YES | LIBERAL},
    {sys::clock_getres, YES | LIBERAL},
    {sys::clock_nanosleep, YES | LIBERAL},
    {sys::select, YES | LIBERAL},
    {sys::pselect6, YES | LIBERAL},
    {sys::setitimer, YES | LIBERAL},
    {sys::getitimer, YES | LIBERAL},
    {sys::mprotect, YES | LIBERAL},
    {sys::getdents, YES | LIBERAL},
    {sys::getdents64, YES | LIBERAL},
    {sys::fdatasync, YES | LIBERAL},
    {sys::mremap, YES | LIBERAL},
    {sys::madvise, YES | LIBERAL},
    {sys::poll, YES | LIBERAL},
    {sys::ppoll, YES | LIBERAL},
    {sys::getcwd, YES | LIBERAL},
    {sys::nanosleep, YES | LIBERAL},
    {sys::rt_sigreturn, YES | LIBERAL | NO_RETVAL},
    {sys::rt_sigaction, YES | LIBERAL},
    {sys::rt_sigprocmask, YES | LIBERAL},
    {sys::rt_sigpending, YES | LIBERAL},
    {sys::rt_sigtimedwait, YES | LIBERAL},
    {sys::rt_sigqueueinfo, YES | LIBERAL},
    {sys::rt_sigsuspend, YES | LIBERAL},
    {sys::sigaltstack, YES | LIBERAL},
    {sys::_sysctl, YES | LIBERAL},
    {sys::futex, YES | LIBERAL},
    {sys::rseq, YES | LIBERAL},
    {sys::getrandom, YES | LIBERAL},
    {sys::sched_yield, YES | LIBERAL},
};

syscall_rule make_rule(unsigned flags) {
    syscall_rule rule;
    if (flags & YES)
        rule.act = action::ALLOW;
    else if (flags & (FILE_ARG1 | FILE_ARG2))
        rule.act = action::ALLOW_IF_PATH;
    rule.path_arg = (flags & FILE_ARG2) ? 2 : 1;
    rule.no_retval = flags & NO_RETVAL;
    rule.sample_mem = flags & SAMPLE_MEM;
    rule.liberal_only = flags & LIBERAL;
    return rule;
}

const vector<env_rule> default_env_rules = {
    {"LIBC_FATAL_STDERR_", string("1")}};

}  // namespace

bool env_rule::operator==(const env_rule &other) const {
    return var == other.var && value == other.value;
}

pair<sys, action> parse_syscall_override(const string &text) {
    auto [name, assignment] = split_assignment(text);
    action act = action::ALLOW;
    if (assignment.first) {
        const string &value = assignment.second;
        if (value == "yes")
            act = action::ALLOW;
        else if (value == "no")
            act = action::DENY;
        else if (value == "file")
            act = action::ALLOW_IF_PATH;
        else
            throw config_error(fmt::format("Unknown syscall action `{}'", value));
    }

    if (auto id = syscall_by_name(name))
        return {*id, act};

    string number = !name.empty() && name[0] == '#' ? name.substr(1) : name;
    if (!is_number(number))
        throw config_error(fmt::format("Unknown syscall `{}'", name));

    uint64_t nr;
    try {
        nr = boost::lexical_cast<uint64_t>(number);
    } catch (boost::bad_lexical_cast &) {
        throw config_error(fmt::format("Syscall `{}' out of range", name));
    }
    auto id = from_native(nr);
    if (!id)
        throw config_error(fmt::format("Syscall `{}' out of range", name));
    return {*id, act};
}

path_rule parse_path_override(const string &text) {
    auto [path, assignment] = split_assignment(text);
    action act = action::ALLOW;
    if (assignment.first) {
        if (assignment.second == "yes")
            act = action::ALLOW;
        else if (assignment.second == "no")
            act = action::DENY;
        else
            throw config_error(fmt::format("Unknown path action `{}'", assignment.second));
    }
    if (path.empty())
        throw config_error("Empty path rule");
    return {path, act};
}

env_rule parse_env_override(const string &text) {
    auto [var, assignment] = split_assignment(text);
    if (var.empty())
        throw config_error(fmt::format("Invalid environment rule `{}'", text));
    if (assignment.first)
        return {var, assignment.second};
    return {var, nullopt};
}

policy_config::policy_config(const policy_overrides &overrides)
    : envs(default_env_rules) {
    for (auto &rule : default_syscall_rules)
        syscalls[static_cast<size_t>(rule.id)] = make_rule(rule.flags);

    if (overrides.allow_fork) {
        set_syscall(sys::fork, action::ALLOW);
        set_syscall(sys::vfork, action::ALLOW);
        set_syscall(sys::clone, action::ALLOW);
        set_syscall(sys::wait4, action::ALLOW);
    }
    if (overrides.allow_times)
        set_syscall(sys::times, action::ALLOW);

    for (auto &text : overrides.syscalls) {
        auto [id, act] = parse_syscall_override(text);
        set_syscall(id, act);
    }
    for (auto &text : overrides.paths)
        user_paths.push_back(parse_path_override(text));
    for (auto &text : overrides.env)
        envs.push_back(parse_env_override(text));
}

// An explicit override keeps what is intrinsic to the syscall (path
// argument, return and memory sampling behaviour) but is effective at every
// filtering level.
void policy_config::set_syscall(sys id, action act) {
    auto &slot = syscalls[static_cast<size_t>(id)];
    syscall_rule rule = slot.value_or(syscall_rule());
    rule.act = act;
    rule.liberal_only = false;
    slot = rule;
    VLOG(2) << "syscall rule " << syscall_name(id) << " = " << static_cast<int>(act);
}

optional<syscall_rule> policy_config::syscall(sys id) const {
    return syscalls[static_cast<size_t>(id)];
}

const vector<path_rule> &policy_config::user_path_rules() const {
    return user_paths;
}

const vector<path_rule> &policy_config::builtin_path_rules() {
    static const vector<path_rule> rules = {
        {"/etc/", action::ALLOW},
        {"/lib/", action::ALLOW},
        {"/lib64/", action::ALLOW},
        {"/usr/lib/", action::ALLOW},
        {"/usr/lib64/", action::ALLOW},
        {"/opt/lib/", action::ALLOW},
        {"/usr/share/zoneinfo/", action::ALLOW},
        {"/usr/share/locale/", action::ALLOW},
        {"/dev/null", action::ALLOW},
        {"/dev/zero", action::ALLOW},
        {"/proc/meminfo", action::ALLOW},
        {"/proc/self/stat", action::ALLOW},
        {"/proc/self/exe", action::ALLOW},  // Needed by FPC 2.0.x runtime
    };
    return rules;
}

const vector<env_rule> &policy_config::env_rules() const {
    return envs;
}

}  // namespace runbox

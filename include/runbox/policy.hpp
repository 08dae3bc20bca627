#pragma once

#include <sys/types.h>
#include <cstdint>
#include <optional>
#include "runbox/policy_config.hpp"

namespace runbox {

enum class verdict {
    ALLOW,
    DENY,
    ALLOW_IF_PATH,  // allowed only if the path argument passes the path validator
    SELF_SIGNAL     // the process signals itself, a deliberate self-termination
};

struct syscall_args {
    uint64_t nr;  // native syscall number
    uint64_t arg1, arg2, arg3;
};

struct decision {
    verdict result;
    syscall_rule rule;

    /**
     * @brief The signal for SELF_SIGNAL
     */
    int signal = 0;

    /**
     * @brief Address of the path for ALLOW_IF_PATH
     */
    uint64_t path_addr = 0;
};

/**
 * @brief Pure syscall decision logic, consulted once per intercepted syscall.
 */
class syscall_policy {
public:
    /**
     * @param config rule tables
     * @param filter_syscalls 1 for liberal, 2 for strict filtering
     * @param box_pid pid of the sandboxed process, to recognize signals to itself
     */
    syscall_policy(const policy_config &config, int filter_syscalls, pid_t box_pid);

    decision decide(const syscall_args &args) const;

private:
    const policy_config &config;
    int filter_syscalls;
    pid_t box_pid;
};

}  // namespace runbox

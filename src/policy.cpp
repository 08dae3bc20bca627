#include "runbox/policy.hpp"
#include <glog/logging.h>

namespace runbox {
using namespace std;

syscall_policy::syscall_policy(const policy_config &config, int filter_syscalls, pid_t box_pid)
    : config(config), filter_syscalls(filter_syscalls), box_pid(box_pid) {}

decision syscall_policy::decide(const syscall_args &args) const {
    optional<sys> id = from_native(args.nr);
    optional<syscall_rule> rule;
    if (id) rule = config.syscall(*id);

    if (rule && rule->liberal_only && filter_syscalls != 1)
        rule.reset();

    if (rule) {
        switch (rule->act) {
            case action::ALLOW:
                return {verdict::ALLOW, *rule};
            case action::ALLOW_IF_PATH: {
                decision d{verdict::ALLOW_IF_PATH, *rule};
                d.path_addr = rule->path_arg == 2 ? args.arg2 : args.arg1;
                return d;
            }
            case action::DENY:
                return {verdict::DENY, *rule};
            default:
                break;
        }
    }

    // Unlisted syscalls are denied, except a process killing itself which is
    // reported as such rather than as a forbidden syscall.
    const uint64_t self = static_cast<uint64_t>(box_pid);
    if (id == sys::kill && args.arg1 == self) {
        decision d{verdict::SELF_SIGNAL, syscall_rule()};
        d.signal = static_cast<int>(args.arg2);
        return d;
    }
    if (id == sys::tgkill && args.arg1 == self && args.arg2 == self) {
        decision d{verdict::SELF_SIGNAL, syscall_rule()};
        d.signal = static_cast<int>(args.arg3);
        return d;
    }

    VLOG(2) << "unlisted syscall " << describe_native(args.nr);
    return {verdict::DENY, syscall_rule()};
}

}  // namespace runbox

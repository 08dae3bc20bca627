#include <asm/unistd_64.h>
#include <csignal>
#include "gtest/gtest.h"
#include "runbox/policy.hpp"

using namespace std;
using namespace runbox;

class PolicyTest : public ::testing::Test {
protected:
    static constexpr pid_t box_pid = 4242;

    decision decide(const policy_config &config, int level, uint64_t nr,
                    uint64_t arg1 = 0, uint64_t arg2 = 0, uint64_t arg3 = 0) {
        syscall_policy policy(config, level, box_pid);
        return policy.decide({nr, arg1, arg2, arg3});
    }

    policy_config defaults;
};

TEST_F(PolicyTest, AllowedEverywhere) {
    EXPECT_EQ(verdict::ALLOW, decide(defaults, 1, __NR_write).result);
    EXPECT_EQ(verdict::ALLOW, decide(defaults, 2, __NR_write).result);
    EXPECT_EQ(verdict::ALLOW, decide(defaults, 2, __NR_exit_group).result);
    EXPECT_TRUE(decide(defaults, 2, __NR_exit_group).rule.sample_mem);
}

TEST_F(PolicyTest, LiberalOnly) {
    EXPECT_EQ(verdict::ALLOW, decide(defaults, 1, __NR_mprotect).result);
    EXPECT_EQ(verdict::DENY, decide(defaults, 2, __NR_mprotect).result);
}

TEST_F(PolicyTest, UnlistedIsDenied) {
    EXPECT_EQ(verdict::DENY, decide(defaults, 1, __NR_mkdir).result);
    EXPECT_EQ(verdict::DENY, decide(defaults, 1, __NR_socket).result);
    EXPECT_EQ(verdict::DENY, decide(defaults, 1, 100000).result);
    EXPECT_EQ(verdict::DENY, decide(defaults, 1, invalid_syscall_nr).result);
}

TEST_F(PolicyTest, StrictIsSubsetOfLiberal) {
    for (size_t i = 0; i < syscall_count; ++i) {
        uint64_t nr = to_native(static_cast<sys>(i));
        if (decide(defaults, 2, nr).result != verdict::DENY) {
            EXPECT_EQ(decide(defaults, 2, nr).result, decide(defaults, 1, nr).result) << describe_native(nr);
        }
    }
}

TEST_F(PolicyTest, PathArgument) {
    decision d = decide(defaults, 1, __NR_open, 0x1000, 0x2000);
    EXPECT_EQ(verdict::ALLOW_IF_PATH, d.result);
    EXPECT_EQ(0x1000u, d.path_addr);

    d = decide(defaults, 2, __NR_openat, (uint64_t)-100, 0x2000);
    EXPECT_EQ(verdict::ALLOW_IF_PATH, d.result);
    EXPECT_EQ(0x2000u, d.path_addr);
}

TEST_F(PolicyTest, SelfSignal) {
    decision d = decide(defaults, 1, __NR_kill, box_pid, SIGTERM);
    EXPECT_EQ(verdict::SELF_SIGNAL, d.result);
    EXPECT_EQ(SIGTERM, d.signal);

    d = decide(defaults, 1, __NR_tgkill, box_pid, box_pid, SIGABRT);
    EXPECT_EQ(verdict::SELF_SIGNAL, d.result);
    EXPECT_EQ(SIGABRT, d.signal);

    EXPECT_EQ(verdict::DENY, decide(defaults, 1, __NR_kill, 1, SIGTERM).result);
    EXPECT_EQ(verdict::DENY, decide(defaults, 1, __NR_tgkill, box_pid, 1, SIGTERM).result);
}

TEST_F(PolicyTest, ExplicitRuleBeatsSelfSignal) {
    policy_overrides overrides;
    overrides.syscalls = {"kill=yes"};
    policy_config config(overrides);
    EXPECT_EQ(verdict::ALLOW, decide(config, 1, __NR_kill, box_pid, SIGTERM).result);
}

TEST_F(PolicyTest, Overrides) {
    policy_overrides overrides;
    overrides.syscalls = {"mkdir=file", "write=no", "mprotect"};
    policy_config config(overrides);

    EXPECT_EQ(verdict::ALLOW_IF_PATH, decide(config, 2, __NR_mkdir).result);
    EXPECT_EQ(verdict::DENY, decide(config, 1, __NR_write).result);
    EXPECT_EQ(verdict::ALLOW, decide(config, 2, __NR_mprotect).result);
}

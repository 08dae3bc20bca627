#include <asm/unistd_64.h>
#include "gtest/gtest.h"
#include "runbox/common/exceptions.hpp"
#include "runbox/syscall_table.hpp"

using namespace std;
using namespace runbox;

TEST(SyscallTableTest, NameAndNumberAgree) {
    EXPECT_STREQ("read", syscall_name(sys::read));
    EXPECT_EQ((uint64_t)__NR_read, to_native(sys::read));
    EXPECT_EQ((uint64_t)__NR_execve, to_native(sys::execve));
    EXPECT_EQ((uint64_t)__NR_openat, to_native(sys::openat));

    EXPECT_EQ(sys::execve, syscall_by_name("execve"));
    EXPECT_EQ(sys::exit_group, from_native(__NR_exit_group));
}

TEST(SyscallTableTest, EveryNameRoundTrips) {
    for (size_t i = 0; i < syscall_count; ++i) {
        sys id = static_cast<sys>(i);
        EXPECT_EQ(id, syscall_by_name(syscall_name(id))) << syscall_name(id);
        EXPECT_EQ(id, from_native(to_native(id))) << syscall_name(id);
    }
}

TEST(SyscallTableTest, UnknownSyscalls) {
    EXPECT_FALSE(syscall_by_name("no_such_syscall"));
    EXPECT_FALSE(syscall_by_name(""));
    EXPECT_FALSE(from_native(100000));
    EXPECT_FALSE(from_native(invalid_syscall_nr));
    // the x32 gap
    EXPECT_FALSE(from_native(400));

    EXPECT_EQ("read", describe_native(__NR_read));
    EXPECT_EQ("#100000", describe_native(100000));
}

TEST(SyscallTableTest, CallMode) {
    EXPECT_EQ(call_mode::NATIVE_64, decode_call_mode(0x33, 0x050f));
    EXPECT_EQ(call_mode::COMPAT_32, decode_call_mode(0x23, 0));
    EXPECT_THROW(decode_call_mode(0x33, 0x80cd), violation);
    EXPECT_FALSE(decode_call_mode(0x33, 0x1234));
    EXPECT_FALSE(decode_call_mode(0x2b, 0x050f));

    try {
        decode_call_mode(0x33, 0x80cd);
    } catch (violation &ex) {
        EXPECT_EQ(status::FORBIDDEN_SYSCALL, ex.code);
    }
}

#include <unistd.h>
#include <vector>
#include "gtest/gtest.h"
#include "runbox/common/exceptions.hpp"
#include "runbox/proc.hpp"

using namespace std;
using namespace runbox;

TEST(ProcTest, ParseStat) {
    string stat = "1234 (a.out) R 1 1234 1234 0 -1 4194304 100 0 0 0 150 25 0 0 20 0 1 0 12345 1000 100";
    EXPECT_EQ(175, parse_stat_cpu_ticks(stat));
}

TEST(ProcTest, ParseStatWithParenthesesInName) {
    string stat = "1234 (evil) 1 2 (x) S 1 1234 1234 0 -1 4194304 100 0 0 0 7 3 0 0 20 0";
    EXPECT_EQ(10, parse_stat_cpu_ticks(stat));
}

TEST(ProcTest, ParseStatErrors) {
    EXPECT_THROW(parse_stat_cpu_ticks("1234 a.out R 1"), internal_error);
    EXPECT_THROW(parse_stat_cpu_ticks("1234 (a.out) R 1 2 3"), internal_error);
    EXPECT_THROW(parse_stat_cpu_ticks("1234 (a.out) R 1 1234 1234 0 -1 4194304 100 0 0 0 x 25"), internal_error);
}

TEST(ProcTest, ParseVmPeak) {
    string status = "Name:\ta.out\nState:\tR (running)\nVmPeak:\t   12345 kB\nVmSize:\t   12000 kB\n";
    EXPECT_EQ(12345, parse_vm_peak(status));
    EXPECT_EQ(-1, parse_vm_peak("Name:\tzombie\nState:\tZ (zombie)\n"));
}

TEST(ProcTest, MonitorOwnProcess) {
    proc_monitor monitor(getpid());
    EXPECT_GE(monitor.cpu_time(), 0);

    EXPECT_EQ(0, monitor.mem_peak());
    monitor.sample_mem_peak();
    long first = monitor.mem_peak();
    EXPECT_GT(first, 0);

    // the recorded peak never decreases
    {
        vector<char> block(64 << 20, 1);
        monitor.sample_mem_peak();
        EXPECT_GE(monitor.mem_peak(), first);
    }
    long second = monitor.mem_peak();
    monitor.sample_mem_peak();
    EXPECT_EQ(second, monitor.mem_peak());
}

TEST(ProcTest, MissingProcess) {
    proc_monitor monitor(-1);
    EXPECT_THROW(monitor.cpu_time(), internal_error);
}

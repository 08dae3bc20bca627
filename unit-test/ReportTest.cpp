#include <sstream>
#include "gtest/gtest.h"
#include "runbox/common/exceptions.hpp"
#include "runbox/report.hpp"

using namespace std;
using namespace runbox;

TEST(ReportTest, SuccessfulRun) {
    run_report report;
    report.cpu_time = 4;
    report.wall_time = 1010;
    report.memory = 1536 * 1024;
    report.syscall_count = 37;

    ostringstream os;
    write_report(os, report);
    EXPECT_EQ("time:0.004\n"
              "time-wall:1.010\n"
              "mem:1572864\n"
              "status:OK\n"
              "message:\n",
              os.str());
    EXPECT_EQ("OK (0.004 sec real, 1.010 sec wall, 2 MB, 37 syscalls)", summary_line(report));
}

TEST(ReportTest, KilledRun) {
    run_report report;
    report.cpu_time = 2345;
    report.wall_time = 2400;
    report.memory = 4096;
    report.result = status::SIGNALED;
    report.message = "Caught fatal signal 11";
    report.exitsig = 11;
    report.killed = true;

    ostringstream os;
    write_report(os, report);
    EXPECT_EQ("time:2.345\n"
              "time-wall:2.400\n"
              "mem:4096\n"
              "exitsig:11\n"
              "killed:1\n"
              "status:SG\n"
              "message:Caught fatal signal 11\n",
              os.str());
    EXPECT_EQ("Caught fatal signal 11", summary_line(report));
}

TEST(ReportTest, ExitCode) {
    run_report report;
    report.result = status::RUNTIME_ERROR;
    report.message = "Exited with error status 3";
    report.exitcode = 3;

    ostringstream os;
    write_report(os, report);
    EXPECT_NE(string::npos, os.str().find("exitcode:3\nstatus:RE\n"));
}

TEST(ReportTest, StatusCodes) {
    EXPECT_STREQ("OK", status_code(status::OK));
    EXPECT_STREQ("RE", status_code(status::RUNTIME_ERROR));
    EXPECT_STREQ("SG", status_code(status::SIGNALED));
    EXPECT_STREQ("SG", status_code(status::SELF_SIGNALED));
    EXPECT_STREQ("TO", status_code(status::TIMEOUT));
    EXPECT_STREQ("FO", status_code(status::FORBIDDEN_SYSCALL));
    EXPECT_STREQ("FA", status_code(status::FORBIDDEN_FILE));
    EXPECT_STREQ("XX", status_code(status::INTERNAL_ERROR));

    EXPECT_EQ(0, exit_code_of(status::OK));
    EXPECT_EQ(1, exit_code_of(status::TIMEOUT));
    EXPECT_EQ(1, exit_code_of(status::FORBIDDEN_FILE));
    EXPECT_EQ(2, exit_code_of(status::INTERNAL_ERROR));
}

TEST(ReportTest, UnwritableSink) {
    EXPECT_THROW(report_sink("/nonexistent-dir/meta"), config_error);
}

#include "runbox/proc.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <sstream>
#include "runbox/common/exceptions.hpp"

namespace runbox {
using namespace std;

const int PROC_BUF_SIZE = 4096;

long parse_stat_cpu_ticks(const string &stat) {
    // The command name is in parentheses and may itself contain spaces and
    // parentheses, so fields are counted from the last ')'
    auto close = stat.rfind(')');
    if (close == string::npos)
        throw internal_error("proc stat syntax error 1");

    istringstream fields(stat.substr(close + 1));
    string field;
    long utime = -1, stime = -1;
    // state ppid pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt utime stime
    for (int i = 0; i < 13 && fields >> field; ++i) {
        try {
            if (i == 11) utime = boost::lexical_cast<long>(field);
            if (i == 12) stime = boost::lexical_cast<long>(field);
        } catch (boost::bad_lexical_cast &) {
            throw internal_error("proc stat syntax error 2");
        }
    }
    if (utime < 0 || stime < 0)
        throw internal_error("proc stat syntax error 2");
    return utime + stime;
}

long parse_vm_peak(const string &status) {
    istringstream lines(status);
    string line;
    while (getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == string::npos || line.compare(0, colon, "VmPeak") != 0)
            continue;
        istringstream value(line.substr(colon + 1));
        long kb;
        if (value >> kb) return kb;
    }
    return -1;
}

proc_monitor::proc_monitor(pid_t pid)
    : pid(pid), ticks_per_sec(sysconf(_SC_CLK_TCK)) {
    if (ticks_per_sec <= 0)
        throw internal_error("Invalid ticks_per_sec!");
}

proc_monitor::~proc_monitor() {
    if (stat_fd >= 0) close(stat_fd);
    if (status_fd >= 0) close(status_fd);
}

string proc_monitor::read_proc_file(const char *name, int &fd) {
    char buf[PROC_BUF_SIZE];
    if (fd < 0) {
        string path = fmt::format("/proc/{}/{}", pid, name);
        fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            throw system_failure(fmt::format("open({})", path));
    }
    ssize_t c = pread(fd, buf, PROC_BUF_SIZE - 1, 0);
    if (c < 0)
        throw system_failure(fmt::format("read on /proc/$pid/{}", name));
    if (c >= PROC_BUF_SIZE - 1)
        throw internal_error(fmt::format("/proc/$pid/{} too long", name));
    return string(buf, c);
}

long proc_monitor::cpu_time() {
    long ticks = parse_stat_cpu_ticks(read_proc_file("stat", stat_fd));
    long ms = ticks * 1000 / ticks_per_sec;
    VLOG(2) << "[time check: " << ms << " msec]";
    return ms;
}

void proc_monitor::sample_mem_peak() {
    long peak = parse_vm_peak(read_proc_file("status", status_fd));
    if (peak > mem_peak_kb)
        mem_peak_kb = peak;
    VLOG(2) << "[mem-peak: " << mem_peak_kb << " KB]";
}

long proc_monitor::mem_peak() const {
    return mem_peak_kb;
}

}  // namespace runbox

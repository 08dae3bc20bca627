#include "runbox/report.hpp"
#include <fmt/core.h>
#include <iostream>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"

namespace runbox {
using namespace std;

template <typename T>
static void append_meta(ostream &os, const char *key, const T &value) {
    os << key << ":" << value << "\n";
}

void write_report(ostream &os, const run_report &report) {
    append_meta(os, "time", format_millis(report.cpu_time));
    append_meta(os, "time-wall", format_millis(report.wall_time));
    append_meta(os, "mem", report.memory);
    if (report.exitcode) append_meta(os, "exitcode", *report.exitcode);
    if (report.exitsig) append_meta(os, "exitsig", *report.exitsig);
    if (report.killed) append_meta(os, "killed", 1);
    append_meta(os, "status", status_code(report.result));
    append_meta(os, "message", report.message);
}

string summary_line(const run_report &report) {
    if (report.result != status::OK)
        return report.message;
    return fmt::format("OK ({} sec real, {} sec wall, {} MB, {} syscalls)",
                       format_millis(report.cpu_time),
                       format_millis(report.wall_time),
                       (report.memory / 1024 + 1023) / 1024,
                       report.syscall_count);
}

report_sink::report_sink(const string &path) {
    if (path.empty()) return;
    if (path == "-") {
        out = &cout;
        return;
    }
    file.open(path, ofstream::out | ofstream::trunc);
    if (!file)
        throw config_error(fmt::format("Failed to open metafile '{}'", path));
    out = &file;
}

void report_sink::emit(const run_report &report) {
    if (out) {
        write_report(*out, report);
        out->flush();
    }
    if (file.is_open()) file.close();
    out = nullptr;

    cerr << summary_line(report) << endl;
}

}  // namespace runbox

#include <glog/logging.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include "runbox/common/exceptions.hpp"
#include "runbox/common/utils.hpp"
#include "runbox/options.hpp"
#include "runbox/policy_config.hpp"
#include "runbox/report.hpp"
#include "runbox/supervisor.hpp"

using namespace std;

/**
 * @brief Time given in seconds on the command line, fractions allowed
 */
struct seconds_arg {
    long millis;
};

void validate(boost::any &v, const vector<string> &values, seconds_arg *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const &s = validators::get_single_string(values);
    auto millis = runbox::parse_seconds(s);
    if (!millis)
        throw validation_error(validation_error::invalid_option_value);

    v = seconds_arg{*millis};
}

static int config_failure(runbox::report_sink *sink, const string &message) {
    if (sink) {
        runbox::run_report report;
        report.result = runbox::status::INTERNAL_ERROR;
        report.message = message;
        sink->emit(report);
    } else {
        cerr << message << endl;
    }
    return runbox::exit_code_of(runbox::status::INTERNAL_ERROR);
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("runbox options");
    po::positional_options_description pos;
    po::variables_map vm;

    runbox::runbox_options opt;
    runbox::policy_overrides overrides;

    // clang-format off
    desc.add_options()
        ("file-access,a", po::value<int>(), "set file access level (0=none, 1=only -p rules, 2=+current directory, 3=+system paths, 4=whole filesystem, 9=no checks)")
        ("chdir,c", po::value<string>(), "change working directory of the command to dir")
        ("full-env,e", "inherit full environment of the parent process")
        ("env,E", po::value<vector<string>>()->composing(), "inherit (VAR), set (VAR=value) or remove (VAR=) an environment variable")
        ("filter-syscalls,f", po::value<int>()->implicit_value(1), "filter system calls (1=liberal, 2=strict)")
        ("allow-fork,F", "allow fork, vfork, clone and wait4, children are not traced")
        ("stdin,i", po::value<string>(), "redirect standard input of the command from file")
        ("stdout,o", po::value<string>(), "redirect standard output of the command to file")
        ("stderr,r", po::value<string>(), "redirect standard error of the command to file (default: same as standard output)")
        ("stack,k", po::value<long>(), "limit stack size to size KB (0=unlimited)")
        ("mem,m", po::value<long>(), "limit address space to size KB")
        ("meta,M", po::value<string>(), "write run results (time, memory, status, ...) to file ('-' for standard output)")
        ("path,p", po::value<vector<string>>()->composing(), "permit (path or path=yes) or forbid (path=no) access to a path, a trailing '/' covers the whole subtree")
        ("syscall,s", po::value<vector<string>>()->composing(), "permit (name=yes), forbid (name=no) or check the path of (name=file) a syscall given by name or #number")
        ("time,t", po::value<seconds_arg>(), "set CPU time limit in seconds (fractions allowed)")
        ("allow-times,T", "allow the times syscall")
        ("verbose,v", po::value<int>()->implicit_value(1), "be verbose (higher levels trace more)")
        ("wall-time,w", po::value<seconds_arg>(), "set wall clock time limit in seconds (fractions allowed)")
        ("extra-time,x", po::value<seconds_arg>(), "CPU time before which a program over its time limit is not yet killed")
        ("cmd", po::value<vector<string>>()->composing()->required(), "command")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);

        if (vm.count("help")) {
            cout << "Runbox: Running a contestant program under ptrace with syscall and file access filtering." << endl
                 << "Usage: " << argv[0] << " [options] -- <command> <arguments>" << endl;
            cout << desc << endl;
            return 0;
        }

        if (vm.count("version")) {
            cout << "runbox" << endl;
            return 0;
        }

        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return runbox::exit_code_of(runbox::status::INTERNAL_ERROR);
    }

    if (vm.count("file-access")) opt.file_access = vm["file-access"].as<int>();
    if (vm.count("chdir")) opt.work_dir = vm["chdir"].as<string>();
    if (vm.count("full-env")) opt.pass_environ = true;
    if (vm.count("env")) overrides.env = vm["env"].as<vector<string>>();
    if (vm.count("filter-syscalls")) opt.filter_syscalls = vm["filter-syscalls"].as<int>();
    if (vm.count("allow-fork")) overrides.allow_fork = true;
    if (vm.count("stdin")) opt.stdin_filename = vm["stdin"].as<string>();
    if (vm.count("stdout")) opt.stdout_filename = vm["stdout"].as<string>();
    if (vm.count("stderr")) opt.stderr_filename = vm["stderr"].as<string>();
    if (vm.count("stack")) opt.stack_limit = vm["stack"].as<long>();
    if (vm.count("mem")) opt.memory_limit = vm["mem"].as<long>();
    if (vm.count("meta")) opt.metafile_path = vm["meta"].as<string>();
    if (vm.count("path")) overrides.paths = vm["path"].as<vector<string>>();
    if (vm.count("syscall")) overrides.syscalls = vm["syscall"].as<vector<string>>();
    if (vm.count("time")) opt.cpu_limit = vm["time"].as<seconds_arg>().millis;
    if (vm.count("allow-times")) overrides.allow_times = true;
    if (vm.count("verbose")) opt.verbose = vm["verbose"].as<int>();
    if (vm.count("wall-time")) opt.wall_limit = vm["wall-time"].as<seconds_arg>().millis;
    if (vm.count("extra-time")) opt.extra_time = vm["extra-time"].as<seconds_arg>().millis;
    opt.command = vm["cmd"].as<vector<string>>();

    FLAGS_v = opt.verbose;
    FLAGS_minloglevel = opt.verbose ? google::GLOG_INFO : google::GLOG_WARNING;

    unique_ptr<runbox::report_sink> sink;
    unique_ptr<runbox::policy_config> config;
    try {
        sink = make_unique<runbox::report_sink>(opt.metafile_path);

        if (opt.file_access < 0 || opt.file_access > 9)
            throw runbox::config_error("File access level must be between 0 and 9");
        if (opt.filter_syscalls < 0 || opt.filter_syscalls > 2)
            throw runbox::config_error("Syscall filter level must be between 0 and 2");
        if (opt.stack_limit < 0 || (opt.memory_limit && *opt.memory_limit <= 0))
            throw runbox::config_error("Memory limits must be positive");

        config = make_unique<runbox::policy_config>(overrides);
    } catch (runbox::config_error &e) {
        return config_failure(sink.get(), e.what());
    }

    // A set-uid installation must not hand its privileges to the child
    uid_t uid = geteuid();
    if (setreuid(uid, uid) < 0)
        return config_failure(sink.get(), runbox::system_failure("setreuid").what());

    runbox::supervisor box(opt, *config);
    runbox::run_report report = box.run();
    sink->emit(report);
    return runbox::exit_code_of(report.result);
}

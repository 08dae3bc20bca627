#include "runbox/child.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <signal.h>
#include <sys/ptrace.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "runbox/common/exceptions.hpp"

namespace runbox {
using namespace std;

const rlim_t MAX_OPEN_FILES = 64;

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_failure(fmt::format("setrlimit({})", resource));
}

static void redirect(int fd, const string &filename, int flags) {
    close(fd);
    if (open(filename.c_str(), flags, 0666) != fd)
        throw system_failure(fmt::format("open(\"{}\")", filename));
}

void close_inherited_fds() {
    if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == 0)
        return;
    if (errno != ENOSYS && errno != EINVAL)
        throw system_failure("close_range");

    // kernels before 5.11 know no CLOSE_RANGE_CLOEXEC
    struct rlimit lim;
    if (getrlimit(RLIMIT_NOFILE, &lim) != 0)
        throw system_failure("getrlimit(RLIMIT_NOFILE)");
    for (rlim_t fd = 3; fd < lim.rlim_cur; ++fd)
        if (fcntl((int)fd, F_SETFD, FD_CLOEXEC) < 0 && errno != EBADF)
            throw system_failure(fmt::format("fcntl({}, F_SETFD)", fd));
}

void set_restrictions(const runbox_options &opt) {
    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        throw system_failure("chdir");

    if (!opt.stdin_filename.empty())
        redirect(STDIN_FILENO, opt.stdin_filename, O_RDONLY);
    if (!opt.stdout_filename.empty())
        redirect(STDOUT_FILENO, opt.stdout_filename, O_WRONLY | O_CREAT | O_TRUNC);
    if (!opt.stderr_filename.empty())
        redirect(STDERR_FILENO, opt.stderr_filename, O_WRONLY | O_CREAT | O_TRUNC);
    else if (dup2(STDOUT_FILENO, STDERR_FILENO) < 0)
        throw system_failure("dup2");

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setpgid(0, 0) != 0)
        throw system_failure("setpgid");

    if (opt.memory_limit) {
        rlim_t bytes = (rlim_t)*opt.memory_limit * 1024;
        set_rlimit(RLIMIT_AS, bytes, bytes);
    }

    if (opt.stack_limit) {
        rlim_t stack = (rlim_t)opt.stack_limit * 1024;
        set_rlimit(RLIMIT_STACK, stack, stack);
    } else {
        // as much as the hard limit permits
        struct rlimit lim;
        if (getrlimit(RLIMIT_STACK, &lim) != 0)
            throw system_failure("getrlimit(RLIMIT_STACK)");
        set_rlimit(RLIMIT_STACK, lim.rlim_max, lim.rlim_max);
    }

    // nothing but the redirected streams may reach the command
    close_inherited_fds();
    set_rlimit(RLIMIT_NOFILE, MAX_OPEN_FILES, MAX_OPEN_FILES);
}

void run_child(const runbox_options &opt, const vector<string> &env, int error_fd) {
    // the supervisor's handlers only set flags in its own address space
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGALRM, SIG_DFL);

    try {
        vector<char *> args, envp;
        for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);
        for (auto &entry : env) envp.push_back(const_cast<char *>(entry.c_str()));
        envp.push_back(nullptr);

        set_restrictions(opt);

        if (opt.filter_syscalls) {
            if (ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) < 0)
                throw system_failure("ptrace(PTRACE_TRACEME)");
            // Stay stopped until the supervisor is ready to trace us
            raise(SIGSTOP);
        }

        execve(args[0], args.data(), envp.data());
        throw system_failure(fmt::format("execve(\"{}\")", opt.command[0]));
    } catch (const exception &e) {
        const char *message = e.what();
        if (write(error_fd, message, strlen(message)) < 0)
            _exit(126);
    }
    _exit(127);
}

}  // namespace runbox

#include "runbox/tracee.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <sys/ptrace.h>
#include <sys/user.h>
#include <unistd.h>
#include <cerrno>
#include "runbox/common/exceptions.hpp"

namespace runbox {
using namespace std;

tracee::tracee(pid_t pid)
    : pid(pid), regs(make_unique<user_regs_struct>()) {}

tracee::~tracee() {
    if (mem_fd >= 0) close(mem_fd);
}

void tracee::set_options() {
    if (ptrace(PTRACE_SETOPTIONS, pid, nullptr, (void *)PTRACE_O_TRACESYSGOOD) < 0)
        throw system_failure("ptrace(PTRACE_SETOPTIONS)");
}

void tracee::resume(int sig) {
    if (ptrace(PTRACE_SYSCALL, pid, nullptr, (void *)(intptr_t)sig) < 0 && errno != ESRCH)
        throw system_failure("ptrace(PTRACE_SYSCALL)");
}

syscall_frame tracee::read_registers(bool at_exit) {
    if (ptrace(PTRACE_GETREGS, pid, nullptr, regs.get()) < 0)
        throw system_failure("ptrace(PTRACE_GETREGS)");

    syscall_frame frame;
    frame.args.nr = regs->orig_rax;
    frame.result = (int64_t)regs->rax;
    frame.args.arg1 = regs->rdi;
    frame.args.arg2 = regs->rsi;
    frame.args.arg3 = regs->rdx;

    if (at_exit)
        return frame;

    uint16_t instr = 0;
    if (regs->cs == 0x33) {
        errno = 0;
        long word = ptrace(PTRACE_PEEKTEXT, pid, (void *)(regs->rip - 2), nullptr);
        if (word == -1 && errno != 0)
            throw system_failure("ptrace(PTRACE_PEEKTEXT)");
        instr = (uint16_t)(word & 0xFFFF);
    }

    auto mode = decode_call_mode(regs->cs, instr);
    if (!mode) {
        if (regs->cs == 0x33)
            throw internal_error(fmt::format("Unknown syscall instruction {:04x}", instr));
        throw internal_error(fmt::format("Unknown code segment {:04x}", (uint64_t)regs->cs));
    }
    frame.mode = *mode;
    if (frame.mode == call_mode::COMPAT_32) {
        frame.args.arg1 = regs->rbx;
        frame.args.arg2 = regs->rcx;
        frame.args.arg3 = regs->rdx;
    }
    return frame;
}

void tracee::write_registers(const syscall_frame &frame) {
    regs->orig_rax = frame.args.nr;
    if (ptrace(PTRACE_SETREGS, pid, nullptr, regs.get()) < 0)
        throw system_failure("ptrace(PTRACE_SETREGS)");
}

ssize_t tracee::read_memory(uint64_t addr, char *buf, size_t len) {
    if (mem_fd < 0) {
        string memname = fmt::format("/proc/{}/mem", pid);
        mem_fd = open(memname.c_str(), O_RDONLY | O_CLOEXEC);
        if (mem_fd < 0)
            throw system_failure(fmt::format("open({})", memname));
    }
    return pread64(mem_fd, buf, len, (off64_t)addr);
}

void tracee::exec_done() {
    if (mem_fd >= 0) {
        close(mem_fd);
        mem_fd = -1;
    }
}

}  // namespace runbox

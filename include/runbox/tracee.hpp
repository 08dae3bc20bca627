#pragma once

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include "runbox/path_check.hpp"
#include "runbox/policy.hpp"
#include "runbox/syscall_table.hpp"

struct user_regs_struct;

namespace runbox {

/**
 * @brief Registers of a syscall stop, as far as the sandbox cares
 */
struct syscall_frame {
    syscall_args args;
    int64_t result = 0;
    call_mode mode = call_mode::NATIVE_64;
};

/**
 * @brief Handle on the traced process through ptrace and /proc/<pid>/mem.
 * Nothing outside this class sees the register layout of the architecture.
 */
class tracee : public memory_reader {
public:
    explicit tracee(pid_t pid);
    ~tracee() override;

    tracee(const tracee &) = delete;
    tracee &operator=(const tracee &) = delete;

    /**
     * @brief Reports syscall stops as SIGTRAP | 0x80
     */
    void set_options();

    /**
     * @brief Resumes until the next syscall stop, delivering sig if non-zero
     */
    void resume(int sig = 0);

    /**
     * @brief Reads the syscall number and arguments at a syscall stop.
     * At entry, also verifies how the syscall was issued.
     * @throw violation(FORBIDDEN_SYSCALL) for a 32-bit syscall
     * @throw internal_error for an unknown code segment or syscall instruction
     */
    syscall_frame read_registers(bool at_exit);

    /**
     * @brief Replaces the syscall number of the stopped syscall
     */
    void write_registers(const syscall_frame &frame);

    ssize_t read_memory(uint64_t addr, char *buf, size_t len) override;

    /**
     * @brief The process replaced its image; memory read so far belongs to the old one
     */
    void exec_done();

private:
    pid_t pid;
    int mem_fd = -1;
    std::unique_ptr<user_regs_struct> regs;
};

}  // namespace runbox

#include "runbox/syscall_table.hpp"
#include <fmt/core.h>
#include <asm/unistd_64.h>
#include <unordered_map>
#include "runbox/common/exceptions.hpp"

#if !defined(__x86_64__)
#error "runbox traces x86_64 processes only"
#endif

namespace runbox {
using namespace std;

static const char *const syscall_names[syscall_count] = {
#define RUNBOX_SYSCALL_NAME(name) #name,
    RUNBOX_SYSCALL_LIST(RUNBOX_SYSCALL_NAME)
#undef RUNBOX_SYSCALL_NAME
};

static const uint64_t native_numbers[syscall_count] = {
#define RUNBOX_SYSCALL_NATIVE(name) __NR_##name,
    RUNBOX_SYSCALL_LIST(RUNBOX_SYSCALL_NATIVE)
#undef RUNBOX_SYSCALL_NATIVE
};

// Native numbers are sparse (the x32 gap between 334 and 424), so the
// reverse table is a map rather than an array.
static const unordered_map<uint64_t, sys> &native_index() {
    static const unordered_map<uint64_t, sys> index = [] {
        unordered_map<uint64_t, sys> result;
        for (size_t i = 0; i < syscall_count; ++i)
            result.emplace(native_numbers[i], static_cast<sys>(i));
        return result;
    }();
    return index;
}

const char *syscall_name(sys id) {
    return syscall_names[static_cast<size_t>(id)];
}

optional<sys> syscall_by_name(const string &name) {
    for (size_t i = 0; i < syscall_count; ++i)
        if (name == syscall_names[i])
            return static_cast<sys>(i);
    return nullopt;
}

optional<sys> from_native(uint64_t nr, call_mode mode) {
    if (mode != call_mode::NATIVE_64) return nullopt;
    auto &index = native_index();
    auto it = index.find(nr);
    if (it == index.end()) return nullopt;
    return it->second;
}

uint64_t to_native(sys id) {
    return native_numbers[static_cast<size_t>(id)];
}

string describe_native(uint64_t nr) {
    if (auto id = from_native(nr))
        return syscall_name(*id);
    return fmt::format("#{}", nr);
}

/*
 * A 64-bit process can still issue INT 0x80 which performs a 32-bit syscall
 * with different numbering and argument registers. The kernel keeps the
 * syscall type internally, so the only way to tell from user space is to
 * look at the instruction the process trapped from.
 */
optional<call_mode> decode_call_mode(uint64_t code_segment, uint16_t instruction) {
    switch (code_segment) {
        case 0x23:
            // 32-bit CPU mode can issue only 32-bit syscalls
            return call_mode::COMPAT_32;
        case 0x33:
            switch (instruction) {
                case 0x050f:  // syscall
                    return call_mode::NATIVE_64;
                case 0x80cd:  // int 0x80
                    throw violation(status::FORBIDDEN_SYSCALL, "Forbidden 32-bit syscall in 64-bit mode");
                default:
                    return nullopt;
            }
        default:
            return nullopt;
    }
}

}  // namespace runbox

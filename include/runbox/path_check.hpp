#pragma once

#include <sys/types.h>
#include <cstdint>
#include <string>
#include "runbox/policy_config.hpp"

namespace runbox {

/**
 * @brief Read access to the address space of the traced process
 */
class memory_reader {
public:
    virtual ~memory_reader() = default;

    /**
     * @brief Reads up to len bytes at addr of the traced process.
     * @return bytes read, 0 if addr is not mapped, -1 with errno on other failures
     */
    virtual ssize_t read_memory(uint64_t addr, char *buf, size_t len) = 0;
};

constexpr size_t max_path_length = 4096;

/**
 * @brief Reads a NUL-terminated string from the traced process, page by page.
 * @throw violation(FORBIDDEN_FILE) if it is not terminated within max_path_length
 * bytes or runs into unmapped memory
 */
std::string read_path(memory_reader &mem, uint64_t addr);

/**
 * @brief Collapses "." segments, repeated slashes and resolvable ".." segments
 * without touching the filesystem. A ".." that would climb above the start of
 * the path is kept, so the result contains ".." exactly when the path escapes.
 */
std::string normalize_path(const std::string &path);

bool escapes_root(const std::string &normalized);

/**
 * @brief Matches one prefix rule against a normalized path.
 * "/etc/" matches "/etc/", "/etc" and "/etc/passwd", but not "/etcx".
 * @return the rule's action, or DEFAULT when it does not match
 */
action match_path_rule(const path_rule &rule, const std::string &path);

/**
 * @brief Decides whether the sandboxed program may name a path.
 * Works on the claimed string only and never looks at the real filesystem.
 */
class path_validator {
public:
    path_validator(const policy_config &config, int file_access);

    /**
     * @brief Reads the path at addr and checks it.
     * @throw violation(FORBIDDEN_FILE) if access is not permitted
     */
    void validate(memory_reader &mem, uint64_t addr) const;

    /**
     * @brief Checks a path already read from the process.
     * The empty path names no file and is always permitted.
     * @throw violation(FORBIDDEN_FILE) if access is not permitted
     */
    void check(const std::string &path) const;

private:
    const policy_config &config;
    int file_access;
};

}  // namespace runbox

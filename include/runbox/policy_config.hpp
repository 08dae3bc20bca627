#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>
#include "runbox/syscall_table.hpp"

namespace runbox {

enum class action {
    DEFAULT,        // no decision, fall through to the next rule
    DENY,
    ALLOW,
    ALLOW_IF_PATH   // allow if the path argument passes the path rules
};

struct syscall_rule {
    action act = action::DENY;

    /**
     * @brief Only effective when filtering liberally (level 1)
     */
    bool liberal_only = false;

    /**
     * @brief The syscall never reaches its exit stop with the same number,
     * e.g. rt_sigreturn
     */
    bool no_retval = false;

    /**
     * @brief Peak memory must be sampled before the syscall runs,
     * the process may not survive it
     */
    bool sample_mem = false;

    /**
     * @brief Which argument (1-based) holds the path for ALLOW_IF_PATH
     */
    int path_arg = 1;
};

struct path_rule {
    std::string prefix;
    action act;
};

/**
 * @brief Environment rule.
 * value == nullopt copies the variable from the caller, an empty value
 * removes the variable, anything else sets it.
 */
struct env_rule {
    std::string var;
    std::optional<std::string> value;

    bool operator==(const env_rule &other) const;
};

/**
 * @brief Caller supplied overrides in command line syntax, applied in order
 */
struct policy_overrides {
    std::vector<std::string> syscalls;  // name[=yes|no|file], #num[=...]
    std::vector<std::string> paths;     // path[=yes|no]
    std::vector<std::string> env;       // VAR, VAR=, VAR=value
    bool allow_fork = false;
    bool allow_times = false;
};

std::pair<sys, action> parse_syscall_override(const std::string &text);
path_rule parse_path_override(const std::string &text);
env_rule parse_env_override(const std::string &text);

/**
 * @brief The three rule tables of the sandbox.
 * Built-in defaults overlaid with caller overrides at construction,
 * immutable afterwards.
 * @throw config_error for malformed overrides
 */
class policy_config {
public:
    explicit policy_config(const policy_overrides &overrides = {});

    /**
     * @brief Rule for the syscall, std::nullopt if it is not listed
     */
    std::optional<syscall_rule> syscall(sys id) const;

    const std::vector<path_rule> &user_path_rules() const;
    static const std::vector<path_rule> &builtin_path_rules();

    /**
     * @brief Built-in environment rules followed by user rules
     */
    const std::vector<env_rule> &env_rules() const;

private:
    void set_syscall(sys id, action act);

    std::array<std::optional<syscall_rule>, syscall_count> syscalls;
    std::vector<path_rule> user_paths;
    std::vector<env_rule> envs;
};

}  // namespace runbox

#pragma once

#include <string>
#include <vector>
#include "runbox/policy_config.hpp"

namespace runbox {

/**
 * @brief Snapshot of the environment of the current process, as "VAR=value" entries
 */
std::vector<std::string> current_environment();

/**
 * @brief Applies env rules in order onto base.
 * Each rule first removes its variable, then sets it or copies it from
 * caller_env unless the rule removes it. Entries keep their relative order.
 */
std::vector<std::string> apply_env_rules(std::vector<std::string> base,
                                         const std::vector<env_rule> &rules,
                                         const std::vector<std::string> &caller_env);

/**
 * @brief Environment passed to the sandboxed program: empty or a full copy
 * of caller_env, depending on pass_environ, with the rules applied.
 */
std::vector<std::string> setup_environment(const std::vector<env_rule> &rules,
                                           bool pass_environ,
                                           const std::vector<std::string> &caller_env);

}  // namespace runbox

#include "runbox/env.hpp"
#include <glog/logging.h>
#include <algorithm>

extern char **environ;

namespace runbox {
using namespace std;

static bool match_env_var(const string &entry, const string &var) {
    return entry.size() > var.size() &&
           entry.compare(0, var.size(), var) == 0 &&
           entry[var.size()] == '=';
}

vector<string> current_environment() {
    vector<string> env;
    for (char **p = environ; p && *p; ++p)
        env.emplace_back(*p);
    return env;
}

vector<string> apply_env_rules(vector<string> env, const vector<env_rule> &rules, const vector<string> &caller_env) {
    for (auto &rule : rules) {
        // First remove the variable if already set
        env.erase(remove_if(env.begin(), env.end(),
                            [&](const string &entry) { return match_env_var(entry, rule.var); }),
                  env.end());

        if (rule.value) {
            if (rule.value->empty())
                continue;
            env.push_back(rule.var + "=" + *rule.value);
        } else {
            auto it = find_if(caller_env.begin(), caller_env.end(),
                              [&](const string &entry) { return match_env_var(entry, rule.var); });
            if (it != caller_env.end())
                env.push_back(*it);
        }
    }
    return env;
}

vector<string> setup_environment(const vector<env_rule> &rules, bool pass_environ, const vector<string> &caller_env) {
    vector<string> base;
    if (pass_environ) base = caller_env;

    vector<string> env = apply_env_rules(move(base), rules, caller_env);

    if (VLOG_IS_ON(2)) {
        VLOG(2) << "Passing environment:";
        for (auto &entry : env)
            VLOG(2) << "\t" << entry;
    }
    return env;
}

}  // namespace runbox

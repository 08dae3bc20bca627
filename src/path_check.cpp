#include "runbox/path_check.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <algorithm>
#include <cerrno>
#include <vector>
#include "runbox/common/exceptions.hpp"

namespace runbox {
using namespace std;

string read_path(memory_reader &mem, uint64_t addr) {
    static const size_t page_size = sysconf(_SC_PAGESIZE);
    string result;
    char buf[max_path_length];

    while (true) {
        // Never cross a page boundary in one read: the next page may be unmapped
        // even though the string ends before it.
        size_t remains = page_size - (addr & (page_size - 1));
        size_t len = min(remains, max_path_length - result.size());
        if (len == 0)
            throw violation(status::FORBIDDEN_FILE, "Access to file with name too long");

        ssize_t n = mem.read_memory(addr, buf, len);
        if (n < 0) {
            if (errno == EIO || errno == EFAULT || errno == EINVAL)
                n = 0;
            else
                throw system_failure("read(mem)");
        }
        if (n == 0)
            throw violation(status::FORBIDDEN_FILE, "Access to file with name out of memory");

        auto nul = find(buf, buf + n, '\0');
        result.append(buf, nul);
        if (nul != buf + n)
            return result;
        addr += n;
    }
}

string normalize_path(const string &path) {
    if (path.empty()) return path;

    bool absolute = path.front() == '/';
    bool trailing = path.back() == '/';

    vector<string> parts, segments;
    boost::split(parts, path, [](char c) { return c == '/'; });
    for (auto &part : parts) {
        if (part.empty() || part == ".")
            continue;
        if (part == ".." && !segments.empty() && segments.back() != "..")
            segments.pop_back();
        else
            segments.push_back(part);
    }

    if (segments.empty())
        return absolute ? "/" : ".";

    string result = (absolute ? "/" : "") + boost::algorithm::join(segments, "/");
    if (trailing) result += '/';
    return result;
}

bool escapes_root(const string &normalized) {
    vector<string> parts;
    boost::split(parts, normalized, [](char c) { return c == '/'; });
    return find(parts.begin(), parts.end(), "..") != parts.end();
}

action match_path_rule(const path_rule &rule, const string &path) {
    const string &prefix = rule.prefix;
    if (path.compare(0, prefix.size(), prefix) == 0) {
        // A rule for a file matches that file only, a rule for a directory
        // (ending with '/') matches everything below it
        if (prefix.back() == '/' || path.size() == prefix.size())
            return rule.act;
        return action::DEFAULT;
    }
    // "/etc/" also matches the directory named without its trailing slash
    if (prefix.back() == '/' && path.size() + 1 == prefix.size() &&
        prefix.compare(0, path.size(), path) == 0)
        return rule.act;
    return action::DEFAULT;
}

path_validator::path_validator(const policy_config &config, int file_access)
    : config(config), file_access(file_access) {}

void path_validator::validate(memory_reader &mem, uint64_t addr) const {
    if (file_access >= 9)
        return;

    check(read_path(mem, addr));
}

void path_validator::check(const string &path) const {
    // An empty name refers to the descriptor argument itself (AT_EMPTY_PATH,
    // how glibc implements fstat), or names nothing and fails with ENOENT
    if (path.empty())
        return;
    if (!file_access)
        throw violation(status::FORBIDDEN_FILE, "File access forbidden");
    VLOG(1) << "[" << path << "]";
    if (file_access >= 4)
        return;

    // Everything in the current directory is permitted
    if (file_access >= 2 && path.find('/') == string::npos && path != "..")
        return;

    string normalized = normalize_path(path);
    action act = action::DEFAULT;
    if (escapes_root(normalized))
        act = action::DENY;

    for (auto it = config.user_path_rules().begin(); act == action::DEFAULT && it != config.user_path_rules().end(); ++it)
        act = match_path_rule(*it, normalized);

    if (file_access >= 3) {
        auto &builtin = policy_config::builtin_path_rules();
        for (auto it = builtin.begin(); act == action::DEFAULT && it != builtin.end(); ++it)
            act = match_path_rule(*it, normalized);
    }

    if (act != action::ALLOW)
        throw violation(status::FORBIDDEN_FILE, fmt::format("Forbidden access to file `{}'", normalized));
}

}  // namespace runbox

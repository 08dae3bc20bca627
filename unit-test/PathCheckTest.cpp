#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <functional>
#include <map>
#include "gtest/gtest.h"
#include "runbox/common/exceptions.hpp"
#include "runbox/path_check.hpp"

using namespace std;
using namespace runbox;

/**
 * @brief Address space made of separately mapped pages
 */
class fake_memory : public memory_reader {
public:
    void map(uint64_t addr, const string &content) {
        for (size_t i = 0; i < content.size(); ++i)
            bytes[addr + i] = content[i];
    }

    ssize_t read_memory(uint64_t addr, char *buf, size_t len) override {
        reads.push_back({addr, len});
        size_t n = 0;
        for (; n < len; ++n) {
            auto it = bytes.find(addr + n);
            if (it == bytes.end()) break;
            buf[n] = it->second;
        }
        if (n == 0) {
            errno = EIO;
            return -1;
        }
        return n;
    }

    std::map<uint64_t, char> bytes;
    vector<pair<uint64_t, size_t>> reads;
};

static string violation_message(const function<void()> &f) {
    try {
        f();
    } catch (violation &ex) {
        EXPECT_EQ(status::FORBIDDEN_FILE, ex.code);
        return ex.what();
    }
    return "";
}

TEST(PathCheckTest, NormalizePath) {
    EXPECT_EQ("", normalize_path(""));
    EXPECT_EQ("/", normalize_path("/"));
    EXPECT_EQ("/", normalize_path("/."));
    EXPECT_EQ(".", normalize_path("./"));
    EXPECT_EQ("/etc/passwd", normalize_path("//etc/./passwd"));
    EXPECT_EQ("/etc/", normalize_path("/etc//"));
    EXPECT_EQ("/etc/passwd", normalize_path("/usr/../etc/passwd"));
    EXPECT_EQ("a/c", normalize_path("a/b/../c"));
    EXPECT_EQ("..", normalize_path("a/../.."));
    EXPECT_EQ("../x", normalize_path("../x"));
    EXPECT_EQ("/../etc/passwd", normalize_path("/../etc/passwd"));
}

TEST(PathCheckTest, NormalizeIsIdempotent) {
    for (const string path : {"", "/", "a//b/./c/../", "../../x", "/tmp/../../etc", "x/.."}) {
        string once = normalize_path(path);
        EXPECT_EQ(once, normalize_path(once)) << path;
    }
}

TEST(PathCheckTest, EscapesRoot) {
    EXPECT_TRUE(escapes_root(normalize_path("../secret")));
    EXPECT_TRUE(escapes_root(normalize_path("/tmp/../../etc/passwd")));
    EXPECT_FALSE(escapes_root(normalize_path("a/../b")));
    EXPECT_FALSE(escapes_root(normalize_path("/tmp/..foo")));
}

TEST(PathCheckTest, MatchPathRule) {
    path_rule dir{"/etc/", action::ALLOW};
    EXPECT_EQ(action::ALLOW, match_path_rule(dir, "/etc/passwd"));
    EXPECT_EQ(action::ALLOW, match_path_rule(dir, "/etc/"));
    EXPECT_EQ(action::ALLOW, match_path_rule(dir, "/etc"));
    EXPECT_EQ(action::DEFAULT, match_path_rule(dir, "/etcx"));
    EXPECT_EQ(action::DEFAULT, match_path_rule(dir, "/et"));

    path_rule file{"/dev/null", action::DENY};
    EXPECT_EQ(action::DENY, match_path_rule(file, "/dev/null"));
    EXPECT_EQ(action::DEFAULT, match_path_rule(file, "/dev/nullx"));
    EXPECT_EQ(action::DEFAULT, match_path_rule(file, "/dev/null/x"));
}

TEST(PathCheckTest, AccessLevels) {
    policy_overrides overrides;
    overrides.paths = {"/home/data/", "/etc/shadow=no"};
    policy_config config(overrides);

    EXPECT_EQ("File access forbidden", violation_message([&] { path_validator(config, 0).check("input.txt"); }));

    path_validator level1(config, 1);
    EXPECT_NO_THROW(level1.check("/home/data/input.txt"));
    EXPECT_THROW(level1.check("input.txt"), violation);
    EXPECT_THROW(level1.check("/etc/passwd"), violation);

    path_validator level2(config, 2);
    EXPECT_NO_THROW(level2.check("input.txt"));
    EXPECT_THROW(level2.check(".."), violation);
    EXPECT_THROW(level2.check("/etc/passwd"), violation);

    path_validator level3(config, 3);
    EXPECT_NO_THROW(level3.check("/etc/passwd"));
    EXPECT_NO_THROW(level3.check("/lib/x86_64-linux-gnu/libc.so.6"));
    EXPECT_NO_THROW(level3.check("/dev/null"));
    EXPECT_EQ("Forbidden access to file `/etc/shadow'", violation_message([&] { level3.check("/etc/shadow"); }));
    EXPECT_EQ("Forbidden access to file `/home/secret'",
              violation_message([&] { level3.check("/home/data/../../home/data/../secret"); }));
    EXPECT_THROW(level3.check("/home/secret"), violation);

    path_validator level4(config, 4);
    EXPECT_NO_THROW(level4.check("/home/secret"));
    EXPECT_NO_THROW(level4.check("/etc/shadow"));
}

TEST(PathCheckTest, TraversalIsDenied) {
    policy_overrides overrides;
    overrides.paths = {"/tmp/"};
    policy_config config(overrides);
    path_validator validator(config, 3);

    EXPECT_EQ("Forbidden access to file `/../etc/passwd'",
              violation_message([&] { validator.check("/tmp/../../etc/passwd"); }));
    EXPECT_THROW(validator.check("../../etc/passwd"), violation);
    EXPECT_NO_THROW(validator.check("/tmp/a/../b"));
}

TEST(PathCheckTest, ReadPathAcrossPages) {
    const uint64_t page = sysconf(_SC_PAGESIZE);
    fake_memory mem;
    uint64_t addr = 10 * page - 4;
    mem.map(addr, string("/etc/passwd") + '\0');

    EXPECT_EQ("/etc/passwd", read_path(mem, addr));
    ASSERT_EQ(2u, mem.reads.size());
    EXPECT_EQ(4u, mem.reads[0].second);
    EXPECT_EQ(10 * page, mem.reads[1].first);
}

TEST(PathCheckTest, ReadPathStopsAtUnmappedPage) {
    const uint64_t page = sysconf(_SC_PAGESIZE);
    fake_memory mem;
    // the string ends right before an unmapped page, which must not be touched
    uint64_t addr = 5 * page - 6;
    mem.map(addr, string("a.txt") + '\0');

    EXPECT_EQ("a.txt", read_path(mem, addr));
    ASSERT_EQ(1u, mem.reads.size());
}

TEST(PathCheckTest, ReadPathFailures) {
    const uint64_t page = sysconf(_SC_PAGESIZE);
    fake_memory mem;

    EXPECT_EQ("Access to file with name out of memory", violation_message([&] { read_path(mem, 0x1000); }));

    mem.map(3 * page - 3, "abc");
    EXPECT_EQ("Access to file with name out of memory", violation_message([&] { read_path(mem, 3 * page - 3); }));

    mem.map(page * 8, string(max_path_length + 10, 'x'));
    EXPECT_EQ("Access to file with name too long", violation_message([&] { read_path(mem, page * 8); }));
}

TEST(PathCheckTest, ValidateReadsOnlyWhenNeeded) {
    policy_config config;
    fake_memory mem;

    // level 9 never looks at the string
    EXPECT_NO_THROW(path_validator(config, 9).validate(mem, 0x1000));
    EXPECT_TRUE(mem.reads.empty());

    mem.map(0x1000, string("/dev/zero") + '\0');
    EXPECT_EQ("File access forbidden", violation_message([&] { path_validator(config, 0).validate(mem, 0x1000); }));
    EXPECT_NO_THROW(path_validator(config, 3).validate(mem, 0x1000));
    EXPECT_THROW(path_validator(config, 1).validate(mem, 0x1000), violation);
}

TEST(PathCheckTest, EmptyPathNamesTheDescriptor) {
    policy_config config;
    fake_memory mem;
    mem.map(0x2000, string(1, '\0'));

    // newfstatat(fd, "", buf, AT_EMPTY_PATH) is how glibc implements fstat
    for (int level : {0, 1, 2, 3, 4}) {
        EXPECT_NO_THROW(path_validator(config, level).validate(mem, 0x2000)) << level;
        EXPECT_NO_THROW(path_validator(config, level).check("")) << level;
    }
}

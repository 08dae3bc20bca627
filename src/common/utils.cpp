#include "runbox/common/utils.hpp"
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <climits>
#include <cmath>

namespace runbox {
using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

pair<string, pair<bool, string>> split_assignment(const string &s) {
    auto idx = s.find('=');
    if (idx == string::npos)
        return {s, {false, ""}};
    return {s.substr(0, idx), {true, s.substr(idx + 1)}};
}

string format_millis(long ms) {
    return fmt::format("{}.{:03d}", ms / 1000, ms % 1000);
}

optional<long> parse_seconds(const string &s) {
    double sec;
    try {
        sec = boost::lexical_cast<double>(s);
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
    if (!isfinite(sec) || sec < 0 || sec > LONG_MAX / 1000)
        return nullopt;
    return lround(sec * 1000);
}

}  // namespace runbox

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace runbox {

bool is_number(const std::string &s);

/**
 * @brief Splits "key=value" at the first '='.
 * @return the key, and whether a '=' was present together with the value
 */
std::pair<std::string, std::pair<bool, std::string>> split_assignment(const std::string &s);

/**
 * @brief Formats milliseconds as "<sec>.<ms>"
 */
std::string format_millis(long ms);

/**
 * @brief Parses a time in seconds, fractions allowed, into milliseconds
 * @return std::nullopt unless it is a non-negative number representable in ms
 */
std::optional<long> parse_seconds(const std::string &s);

}  // namespace runbox

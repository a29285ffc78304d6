#pragma once

#include <string_view>
#include <vector>

namespace rmqconf {

// A pattern segment equal to this matches exactly one key segment
constexpr std::string_view WILDCARD = "*";
constexpr char WILDCARD_CHAR = '*';
constexpr char KEY_SEPARATOR = '.';

// Split a dotted key on '.', keeping empty segments ("a..b" -> {"a", "", "b"})
std::vector<std::string_view> split_key(std::string_view key);

// Whether `key` matches `pattern` segment by segment. Counts must be equal;
// a "*" pattern segment matches any one key segment, every other segment must
// be identical. "*" is never a partial-segment or multi-segment wildcard.
bool matches(std::string_view key, std::string_view pattern);

// Whether the string contains the wildcard character anywhere
bool is_pattern(std::string_view key);

} // namespace rmqconf

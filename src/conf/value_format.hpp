#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rmqconf {

constexpr char QUOTE_CHAR = '\'';
constexpr char COMMENT_CHAR = '#';

// A value is written single-quoted when it holds a space, '#' or '\''
bool needs_quoting(std::string_view value);

// The value as it appears on the right-hand side of "key = value"
std::string format_value(std::string_view value);

// Whole-string decimal integer, optional leading sign
std::optional<int64_t> parse_int(std::string_view value);

// Whole-string floating point value ("3.14", "42", "1e3", "-0.5")
std::optional<double> parse_float(std::string_view value);

// true/on/yes/1 and false/off/no/0, exact and case-sensitive
std::optional<bool> parse_bool(std::string_view value);

} // namespace rmqconf

#pragma once

#include "conf/errors.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace rmqconf {

// ============================================================================
// Line types
// ============================================================================

// key = value
struct Setting {
    std::string key;
    std::string value;
};

// Original text, untrimmed, including the leading '#'
struct Comment {
    std::string text;
};

// Blank or whitespace-only line (also what a removed setting becomes)
struct Empty {};

using Line = std::variant<Setting, Comment, Empty>;

// ============================================================================
// Parsing
// ============================================================================

// Classify one line of text (without its line terminator).
//
// Settings follow: [ws] key [ws] '=' [ws] value [ws ['#' comment]], where the
// key is made of letters, digits, '_' and '.' and must then pass
// is_valid_key_format. A value starting with '\'' runs to the next '\''
// literally; otherwise it runs up to '#' or end of line, right-trimmed.
//
// Errors carry `line_number` (1-based).
std::expected<Line, ConfError> parse_line(std::string_view text, size_t line_number);

} // namespace rmqconf

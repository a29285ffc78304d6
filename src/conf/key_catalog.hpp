#pragma once

#include <string_view>
#include <vector>

namespace rmqconf {

// A known key shape from the broker's schema. Any segment may be "*"
// (schema variables such as $name or $id).
struct KnownKeyTemplate {
    std::string_view pattern;  // e.g. "listeners.tcp.*"
    std::string_view group;    // e.g. "Listeners"
};

// The process-wide catalog, in schema order. Built once, never mutated.
const std::vector<KnownKeyTemplate>& known_key_templates();

// ASCII character classes for keys, independent of the C locale
constexpr bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

constexpr bool is_ascii_alnum(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

// Syntactic check: non-empty, no empty segments, and every segment is either
// all digits or starts with a letter/underscore followed by letters, digits,
// underscores or hyphens.
bool is_valid_key_format(std::string_view key);

// Whether the key matches at least one catalog template
bool is_known_key(std::string_view key);

// Max number of suggestions returned by suggest_similar_keys
constexpr size_t MAX_SUGGESTIONS = 5;

// Up to MAX_SUGGESTIONS templates whose first segment equals the key's first
// segment (or is "*"), in catalog order. Empty when nothing shares it.
std::vector<std::string_view> suggest_similar_keys(std::string_view key);

} // namespace rmqconf

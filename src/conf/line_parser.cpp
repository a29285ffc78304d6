#include "conf/line_parser.hpp"
#include "conf/key_catalog.hpp"
#include "conf/value_format.hpp"

#include <utility>

namespace rmqconf {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\v\f";

bool is_key_char(char c) {
    return is_ascii_alnum(c) || c == '_' || c == '.';
}

size_t skip_whitespace(std::string_view text, size_t pos) {
    size_t next = text.find_first_not_of(WHITESPACE, pos);
    return next == std::string_view::npos ? text.size() : next;
}

std::string_view trim_right(std::string_view text) {
    size_t end = text.find_last_not_of(WHITESPACE);
    return end == std::string_view::npos ? std::string_view{} : text.substr(0, end + 1);
}

// 'literal' followed only by whitespace or an inline comment
bool parse_quoted_value(std::string_view text, size_t value_start, std::string& value) {
    size_t close = text.find(QUOTE_CHAR, value_start + 1);
    if (close == std::string_view::npos) {
        return false;
    }
    size_t rest = skip_whitespace(text, close + 1);
    if (rest != text.size() && text[rest] != COMMENT_CHAR) {
        return false;
    }
    value.assign(text.substr(value_start + 1, close - value_start - 1));
    return true;
}

// Everything up to '#' or end of line. A value that still starts and ends
// with a quote (e.g. 'it's' written for it's) loses the outer pair.
std::string parse_unquoted_value(std::string_view text, size_t value_start) {
    std::string_view raw = text.substr(value_start);
    raw = trim_right(raw.substr(0, raw.find(COMMENT_CHAR)));

    if (raw.size() >= 2 && raw.front() == QUOTE_CHAR && raw.back() == QUOTE_CHAR) {
        raw = raw.substr(1, raw.size() - 2);
    }
    return std::string(raw);
}

ConfError invalid_line(std::string_view text, size_t line_number) {
    return ConfError::parse(line_number, "invalid line: " + std::string(text));
}

} // anonymous namespace

std::expected<Line, ConfError> parse_line(std::string_view text, size_t line_number) {
    size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return Empty{};
    }
    if (text[first] == COMMENT_CHAR) {
        return Comment{std::string(text)};
    }

    // key
    size_t key_end = first;
    while (key_end < text.size() && is_key_char(text[key_end])) {
        ++key_end;
    }
    if (key_end == first) {
        return std::unexpected(invalid_line(text, line_number));
    }
    std::string key(text.substr(first, key_end - first));

    // '='
    size_t eq = skip_whitespace(text, key_end);
    if (eq == text.size() || text[eq] != '=') {
        return std::unexpected(invalid_line(text, line_number));
    }

    // value
    size_t value_start = skip_whitespace(text, eq + 1);
    std::string value;
    bool quoted = value_start < text.size() && text[value_start] == QUOTE_CHAR &&
                  parse_quoted_value(text, value_start, value);
    if (!quoted) {
        value = parse_unquoted_value(text, value_start);
    }

    if (!is_valid_key_format(key)) {
        return std::unexpected(ConfError::parse(line_number, "invalid key format: " + key));
    }

    return Setting{std::move(key), std::move(value)};
}

} // namespace rmqconf

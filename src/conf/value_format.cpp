#include "conf/value_format.hpp"

#include <charconv>
#include <system_error>

namespace rmqconf {

bool needs_quoting(std::string_view value) {
    return value.find_first_of(" #'") != std::string_view::npos;
}

std::string format_value(std::string_view value) {
    if (!needs_quoting(value)) {
        return std::string(value);
    }
    std::string result;
    result.reserve(value.size() + 2);
    result += QUOTE_CHAR;
    result += value;
    result += QUOTE_CHAR;
    return result;
}

std::optional<int64_t> parse_int(std::string_view value) {
    // from_chars rejects a leading '+', strip it (but not "+-1")
    if (value.size() > 1 && value.front() == '+' && value[1] != '-') {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<double> parse_float(std::string_view value) {
    if (value.size() > 1 && value.front() == '+' && value[1] != '-') {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    double result = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> parse_bool(std::string_view value) {
    if (value == "true" || value == "on" || value == "yes" || value == "1") return true;
    if (value == "false" || value == "off" || value == "no" || value == "0") return false;
    return std::nullopt;
}

} // namespace rmqconf

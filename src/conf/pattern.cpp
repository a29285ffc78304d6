#include "conf/pattern.hpp"

namespace rmqconf {

std::vector<std::string_view> split_key(std::string_view key) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (true) {
        size_t dot = key.find(KEY_SEPARATOR, start);
        if (dot == std::string_view::npos) {
            segments.push_back(key.substr(start));
            break;
        }
        segments.push_back(key.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool matches(std::string_view key, std::string_view pattern) {
    auto key_parts = split_key(key);
    auto pattern_parts = split_key(pattern);

    if (key_parts.size() != pattern_parts.size()) {
        return false;
    }

    for (size_t i = 0; i < key_parts.size(); ++i) {
        if (pattern_parts[i] != WILDCARD && pattern_parts[i] != key_parts[i]) {
            return false;
        }
    }
    return true;
}

bool is_pattern(std::string_view key) {
    return key.find(WILDCARD_CHAR) != std::string_view::npos;
}

} // namespace rmqconf

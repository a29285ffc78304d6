#include "cli/key_policy.hpp"
#include "conf/key_catalog.hpp"

#include <utility>

namespace rmqconf::cli {

std::string describe_unknown_key(std::string_view key, const std::vector<std::string_view>& suggestions) {
    std::string message(key);
    if (suggestions.empty()) {
        return message;
    }
    message += ". Similar keys: ";
    for (size_t i = 0; i < suggestions.size(); ++i) {
        if (i > 0) message += ", ";
        message += suggestions[i];
    }
    return message;
}

std::expected<KeyCheck, ConfError> check_key_for_write(std::string_view key, bool force) {
    if (!is_valid_key_format(key)) {
        return std::unexpected(ConfError::invalid_key_format(std::string(key)));
    }

    KeyCheck check;
    if (is_known_key(key)) {
        return check;
    }

    check.known = false;
    check.suggestions = suggest_similar_keys(key);
    if (!force) {
        auto error = ConfError::unknown_key(std::string(key));
        error.message = describe_unknown_key(key, check.suggestions);
        return std::unexpected(std::move(error));
    }
    return check;
}

std::expected<void, ConfError> check_value_for_write(std::string_view key, std::string_view value) {
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        return std::unexpected(ConfError::invalid_value(std::string(key), "value contains a line break"));
    }
    return {};
}

}  // namespace rmqconf::cli

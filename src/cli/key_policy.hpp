#pragma once

#include "conf/errors.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace rmqconf::cli {

struct KeyCheck {
    bool known = true;
    std::vector<std::string_view> suggestions;  // filled for unknown keys
};

// Write policy applied before ConfDocument::set:
//   malformed key              -> INVALID_KEY_FORMAT
//   unknown key, not forced    -> UNKNOWN_KEY (message lists similar keys)
//   unknown key, forced        -> ok, known == false
std::expected<KeyCheck, ConfError> check_key_for_write(std::string_view key, bool force);

// Values that cannot be written on a single line are rejected with
// INVALID_VALUE (the file would no longer parse)
std::expected<void, ConfError> check_value_for_write(std::string_view key, std::string_view value);

// "<key>. Similar keys: a, b" or just "<key>" when there are no suggestions
std::string describe_unknown_key(std::string_view key, const std::vector<std::string_view>& suggestions);

}  // namespace rmqconf::cli

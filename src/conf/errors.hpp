#pragma once

#include <cstddef>
#include <string>
#include <system_error>

namespace rmqconf {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfErrorCode {
    PARSE_ERROR,
    IO_ERROR,
    INVALID_KEY_FORMAT,
    UNKNOWN_KEY,
    KEY_NOT_FOUND,
    INVALID_VALUE,
};

struct ConfError {
    ConfErrorCode code = ConfErrorCode::PARSE_ERROR;
    size_t line = 0;          // 1-based, PARSE_ERROR only
    std::string message;
    std::error_code io;       // IO_ERROR only, as reported by the filesystem

    static ConfError parse(size_t line, std::string message);
    static ConfError io_failure(std::error_code ec, std::string message);
    static ConfError invalid_key_format(const std::string& key);
    static ConfError unknown_key(const std::string& key);
    static ConfError key_not_found(const std::string& key);
    static ConfError invalid_value(const std::string& key, const std::string& reason);
};

std::string conf_error_code_message(ConfErrorCode code);

// "parse error at line 3: invalid line: foo", "key not found: heartbeat", ...
std::string to_string(const ConfError& error);

} // namespace rmqconf

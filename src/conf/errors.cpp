#include "conf/errors.hpp"

#include <utility>

namespace rmqconf {

ConfError ConfError::parse(size_t line, std::string message) {
    return ConfError{ConfErrorCode::PARSE_ERROR, line, std::move(message), {}};
}

ConfError ConfError::io_failure(std::error_code ec, std::string message) {
    return ConfError{ConfErrorCode::IO_ERROR, 0, std::move(message), ec};
}

ConfError ConfError::invalid_key_format(const std::string& key) {
    return ConfError{ConfErrorCode::INVALID_KEY_FORMAT, 0, key, {}};
}

ConfError ConfError::unknown_key(const std::string& key) {
    return ConfError{ConfErrorCode::UNKNOWN_KEY, 0, key, {}};
}

ConfError ConfError::key_not_found(const std::string& key) {
    return ConfError{ConfErrorCode::KEY_NOT_FOUND, 0, key, {}};
}

ConfError ConfError::invalid_value(const std::string& key, const std::string& reason) {
    return ConfError{ConfErrorCode::INVALID_VALUE, 0, key + ": " + reason, {}};
}

std::string conf_error_code_message(ConfErrorCode code) {
    switch (code) {
        case ConfErrorCode::PARSE_ERROR: return "parse error";
        case ConfErrorCode::IO_ERROR: return "I/O error";
        case ConfErrorCode::INVALID_KEY_FORMAT: return "invalid key format";
        case ConfErrorCode::UNKNOWN_KEY: return "unknown configuration key";
        case ConfErrorCode::KEY_NOT_FOUND: return "key not found";
        case ConfErrorCode::INVALID_VALUE: return "invalid value";
        default: return "unknown error";
    }
}

std::string to_string(const ConfError& error) {
    switch (error.code) {
        case ConfErrorCode::PARSE_ERROR:
            return "parse error at line " + std::to_string(error.line) + ": " + error.message;
        case ConfErrorCode::IO_ERROR:
            if (error.io) {
                return "I/O error: " + error.message + ": " + error.io.message();
            }
            return "I/O error: " + error.message;
        default:
            return conf_error_code_message(error.code) + ": " + error.message;
    }
}

} // namespace rmqconf

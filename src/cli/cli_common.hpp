#pragma once

#include "cli/key_policy.hpp"
#include "cli/version.hpp"
#include "common/log.hpp"
#include "conf/document.hpp"
#include "conf/errors.hpp"
#include "conf/key_catalog.hpp"

#include <boost/json.hpp>

#include <expected>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace rmqconf::cli {

constexpr const char* DEFAULT_CONF_FILE = "rabbitmq.conf";
constexpr const char* CONF_FILE_ENV = "RMQCONF_FILE";

// Options shared by every command
struct CliContext {
    std::filesystem::path conf_file = DEFAULT_CONF_FILE;
};

inline const log::Logger& cli_log() {
    static const log::Logger instance(log::CLI_LOGGER);
    return instance;
}

// "Error: ..." on stderr, or {"status":"error",...} on stdout with --json
inline int report_error(const std::string& message, bool json_output) {
    if (json_output) {
        boost::json::object obj;
        obj["status"] = "error";
        obj["message"] = message;
        std::cout << boost::json::serialize(obj) << "\n";
    } else {
        std::cerr << "Error: " << message << "\n";
    }
    return 1;
}

inline int report_error(const ConfError& error, bool json_output) {
    return report_error(to_string(error), json_output);
}

// Load the configuration file, which must exist
inline std::expected<ConfDocument, ConfError> load_existing(const CliContext& ctx) {
    std::error_code ec;
    if (!std::filesystem::exists(ctx.conf_file, ec)) {
        return std::unexpected(ConfError::io_failure(
            std::make_error_code(std::errc::no_such_file_or_directory),
            "configuration file not found: " + ctx.conf_file.string()));
    }
    return ConfDocument::load(ctx.conf_file);
}

}  // namespace rmqconf::cli

// Command declarations (global scope, called from main)
int cmd_version();
int cmd_get(const rmqconf::cli::CliContext& ctx, int argc, char* argv[]);
int cmd_set(const rmqconf::cli::CliContext& ctx, int argc, char* argv[]);
int cmd_remove(const rmqconf::cli::CliContext& ctx, int argc, char* argv[]);
int cmd_list(const rmqconf::cli::CliContext& ctx, int argc, char* argv[]);
int cmd_inspect(const rmqconf::cli::CliContext& ctx, int argc, char* argv[]);
int cmd_check(const rmqconf::cli::CliContext& ctx, int argc, char* argv[]);
int cmd_keys(int argc, char* argv[]);

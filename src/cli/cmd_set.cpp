#include "cli_common.hpp"

using namespace rmqconf;
using namespace rmqconf::cli;

static void print_set_help() {
    std::cout << "rmqconf - Set a configuration value\n\n"
              << "Usage: rmqconf [-f <file>] set <key> <value> [options]\n\n"
              << "Keys are validated against the known rabbitmq.conf schema.\n"
              << "The file is created if it does not exist.\n\n"
              << "Options:\n"
              << "  -f, --force   Set the key even if it is not recognized\n"
              << "  --json        Output in JSON format\n"
              << "  -h, --help    Show this help\n\n"
              << "Examples:\n"
              << "  rmqconf set listeners.tcp.default 5672\n"
              << "  rmqconf set cluster_name 'prod cluster'\n"
              << "  rmqconf set my_plugin.setting on --force\n";
}

static void print_remove_help() {
    std::cout << "rmqconf - Remove a configuration value\n\n"
              << "Usage: rmqconf [-f <file>] remove <key>\n\n"
              << "The setting's line is left blank; other lines keep their positions.\n";
}

int cmd_set(const CliContext& ctx, int argc, char* argv[]) {
    bool force = false;
    bool json_output = false;
    std::vector<std::string> positional;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_set_help(); return 0; }
        else if (arg == "-f" || arg == "--force") force = true;
        else if (arg == "--json") json_output = true;
        else positional.push_back(arg);
    }

    if (positional.size() != 2) {
        std::cerr << "Error: set requires a key and a value\nUsage: rmqconf set <key> <value>\n";
        return 1;
    }
    const std::string& key = positional[0];
    const std::string& value = positional[1];

    auto check = check_key_for_write(key, force);
    if (!check) return report_error(check.error(), json_output);
    if (auto valid = check_value_for_write(key, value); !valid) {
        return report_error(valid.error(), json_output);
    }
    if (!check->known) {
        cli_log().warn("unknown key: {}", key);
        if (!json_output) std::cerr << "Warning: unknown key: " << key << "\n";
    }

    std::error_code ec;
    auto dir = ctx.conf_file.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return report_error(ConfError::io_failure(ec, "cannot create " + dir.string()), json_output);
        }
        cli_log().debug("Created directory {}", dir.string());
    }

    ConfDocument conf;
    if (std::filesystem::exists(ctx.conf_file, ec)) {
        auto loaded = ConfDocument::load(ctx.conf_file);
        if (!loaded) return report_error(loaded.error(), json_output);
        conf = std::move(*loaded);
    }

    bool was_updated = conf.contains_key(key);
    conf.set(key, value);

    if (auto saved = conf.save(ctx.conf_file); !saved) {
        return report_error(saved.error(), json_output);
    }
    cli_log().info("{} {} in {}", was_updated ? "Updated" : "Set", key, ctx.conf_file.string());

    if (json_output) {
        boost::json::object obj;
        obj["status"] = "ok";
        obj["key"] = key;
        obj["value"] = value;
        obj["updated"] = was_updated;
        obj["known"] = check->known;
        std::cout << boost::json::serialize(obj) << "\n";
    } else {
        std::cout << (was_updated ? "updated " : "set ") << key << " = " << value << "\n";
    }
    return 0;
}

int cmd_remove(const CliContext& ctx, int argc, char* argv[]) {
    std::string key;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_remove_help(); return 0; }
        else if (key.empty()) key = arg;
        else { std::cerr << "Unexpected argument: " << arg << "\n\n"; print_remove_help(); return 1; }
    }

    if (key.empty()) {
        std::cerr << "Error: remove requires a key\nUsage: rmqconf remove <key>\n";
        return 1;
    }

    auto conf = load_existing(ctx);
    if (!conf) return report_error(conf.error(), false);

    if (!conf->remove(key)) {
        return report_error(ConfError::key_not_found(key), false);
    }
    if (auto saved = conf->save(ctx.conf_file); !saved) {
        return report_error(saved.error(), false);
    }
    cli_log().info("Removed {} from {}", key, ctx.conf_file.string());

    std::cout << "removed " << key << "\n";
    return 0;
}

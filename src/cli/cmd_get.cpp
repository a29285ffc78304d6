#include "cli_common.hpp"

using namespace rmqconf;
using namespace rmqconf::cli;

static void print_get_help() {
    std::cout << "rmqconf - Get a configuration value\n\n"
              << "Usage: rmqconf [-f <file>] get <key-or-pattern> [options]\n\n"
              << "A '*' segment matches exactly one key segment:\n"
              << "  listeners.tcp.*   matches listeners.tcp.default, listeners.tcp.amqp\n"
              << "  log.*.level       matches log.console.level, log.file.level\n\n"
              << "Options:\n"
              << "  --json        Output in JSON format\n"
              << "  -h, --help    Show this help\n\n"
              << "Examples:\n"
              << "  rmqconf get heartbeat\n"
              << "  rmqconf get 'listeners.tcp.*'\n";
}

int cmd_get(const CliContext& ctx, int argc, char* argv[]) {
    bool json_output = false;
    std::string key;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_get_help(); return 0; }
        else if (arg == "--json") json_output = true;
        else if (key.empty()) key = arg;
        else { std::cerr << "Unexpected argument: " << arg << "\n\n"; print_get_help(); return 1; }
    }

    if (key.empty()) {
        std::cerr << "Error: get requires a key\nUsage: rmqconf get <key-or-pattern>\n";
        return 1;
    }

    auto conf = load_existing(ctx);
    if (!conf) return report_error(conf.error(), json_output);

    if (ConfDocument::is_pattern(key)) {
        auto matches = conf->get_matching(key);
        if (matches.empty()) {
            return report_error("no keys matching pattern: " + key, json_output);
        }

        if (json_output) {
            boost::json::array items;
            for (const auto& [k, v] : matches) {
                items.push_back(boost::json::object{{"key", k}, {"value", v}});
            }
            boost::json::object obj;
            obj["status"] = "ok";
            obj["pattern"] = key;
            obj["matches"] = std::move(items);
            std::cout << boost::json::serialize(obj) << "\n";
        } else {
            for (const auto& [k, v] : matches) {
                std::cout << k << " = " << v << "\n";
            }
        }
        return 0;
    }

    auto value = conf->get(key);
    if (!value) {
        return report_error(ConfError::key_not_found(key), json_output);
    }

    if (json_output) {
        boost::json::object obj;
        obj["status"] = "ok";
        obj["key"] = key;
        obj["value"] = *value;
        std::cout << boost::json::serialize(obj) << "\n";
    } else {
        std::cout << *value << "\n";
    }
    return 0;
}

#include "cli_common.hpp"

using namespace rmqconf;
using namespace rmqconf::cli;

static void print_list_help() {
    std::cout << "rmqconf - List configuration values\n\n"
              << "Usage: rmqconf [-f <file>] list [options]\n\n"
              << "Keys are listed alphabetically. A key set more than once shows its\n"
              << "last value.\n\n"
              << "Options:\n"
              << "  --json        Output in JSON format\n"
              << "  -h, --help    Show this help\n";
}

int cmd_list(const CliContext& ctx, int argc, char* argv[]) {
    bool json_output = false;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_list_help(); return 0; }
        if (arg == "--json") json_output = true;
        else { std::cerr << "Unknown option: " << arg << "\n\n"; print_list_help(); return 1; }
    }

    auto conf = load_existing(ctx);
    if (!conf) return report_error(conf.error(), json_output);

    if (json_output) {
        boost::json::array items;
        for (const auto& key : conf->keys()) {
            items.push_back(boost::json::object{{"key", key}, {"value", conf->get(key).value_or("")}});
        }
        boost::json::object obj;
        obj["status"] = "ok";
        obj["file"] = ctx.conf_file.string();
        obj["config"] = std::move(items);
        std::cout << boost::json::serialize(obj) << "\n";
        return 0;
    }

    for (const auto& key : conf->keys()) {
        std::cout << key << " = " << conf->get(key).value_or("") << "\n";
    }
    return 0;
}

int cmd_inspect(const CliContext& ctx, int argc, char* argv[]) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "rmqconf - Print the configuration file as rmqconf writes it\n\n"
                      << "Usage: rmqconf [-f <file>] inspect\n";
            return 0;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        return 1;
    }

    auto conf = load_existing(ctx);
    if (!conf) return report_error(conf.error(), false);

    std::cout << conf->to_text();
    return 0;
}

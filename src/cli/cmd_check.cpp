#include "cli_common.hpp"

using namespace rmqconf;
using namespace rmqconf::cli;

static void print_check_help() {
    std::cout << "rmqconf - Check a configuration file against the known schema\n\n"
              << "Usage: rmqconf [-f <file>] check [options]\n\n"
              << "Parses the file and reports every key the schema does not know.\n"
              << "Exits with status 1 when the file does not parse or has unknown keys.\n\n"
              << "Options:\n"
              << "  --json        Output in JSON format\n"
              << "  -h, --help    Show this help\n";
}

static void print_keys_help() {
    std::cout << "rmqconf - Show known configuration keys\n\n"
              << "Usage: rmqconf keys [key]\n\n"
              << "Without arguments prints every known key template ('*' stands for any\n"
              << "single segment). With a key, tells whether it is known and suggests\n"
              << "similar keys otherwise.\n";
}

int cmd_check(const CliContext& ctx, int argc, char* argv[]) {
    bool json_output = false;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_check_help(); return 0; }
        if (arg == "--json") json_output = true;
        else { std::cerr << "Unknown option: " << arg << "\n\n"; print_check_help(); return 1; }
    }

    auto conf = load_existing(ctx);
    if (!conf) return report_error(conf.error(), json_output);

    auto keys = conf->keys();
    boost::json::array unknown;
    size_t unknown_count = 0;
    for (const auto& key : keys) {
        if (is_known_key(key)) continue;

        ++unknown_count;
        auto suggestions = suggest_similar_keys(key);
        cli_log().debug("Unknown key {} ({} suggestions)", key, suggestions.size());
        if (json_output) {
            boost::json::array similar;
            for (auto s : suggestions) similar.emplace_back(s);
            unknown.push_back(boost::json::object{{"key", key}, {"similar", std::move(similar)}});
        } else {
            std::cout << "unknown key: " << describe_unknown_key(key, suggestions) << "\n";
        }
    }

    if (json_output) {
        boost::json::object obj;
        obj["status"] = unknown_count == 0 ? "ok" : "unknown_keys";
        obj["file"] = ctx.conf_file.string();
        obj["keys"] = keys.size();
        obj["unknown"] = std::move(unknown);
        std::cout << boost::json::serialize(obj) << "\n";
    } else {
        std::cout << ctx.conf_file.string() << ": " << keys.size() << " keys, "
                  << unknown_count << " unknown\n";
    }
    return unknown_count == 0 ? 0 : 1;
}

int cmd_keys(int argc, char* argv[]) {
    std::string key;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_keys_help(); return 0; }
        else if (key.empty()) key = arg;
        else { std::cerr << "Unexpected argument: " << arg << "\n\n"; print_keys_help(); return 1; }
    }

    if (key.empty()) {
        std::string_view current_group;
        for (const auto& t : known_key_templates()) {
            if (t.group != current_group) {
                if (!current_group.empty()) std::cout << "\n";
                std::cout << "[" << t.group << "]\n";
                current_group = t.group;
            }
            std::cout << "  " << t.pattern << "\n";
        }
        return 0;
    }

    if (!is_valid_key_format(key)) {
        return report_error(ConfError::invalid_key_format(key), false);
    }
    if (is_known_key(key)) {
        std::cout << key << " is a known key\n";
        return 0;
    }

    auto suggestions = suggest_similar_keys(key);
    std::cout << key << " is not a known key\n";
    if (!suggestions.empty()) {
        std::cout << "Similar keys:\n";
        for (auto s : suggestions) {
            std::cout << "  " << s << "\n";
        }
    }
    return 1;
}

#include "cli_common.hpp"

#include <cstdlib>

using namespace rmqconf;
using namespace rmqconf::cli;

static void print_usage(const char* program) {
    std::cout << "rmqconf - Read and edit rabbitmq.conf files\n\n"
              << "Usage: " << program << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  get <key|pattern>     Print a value, or every key matching a pattern\n"
              << "  set <key> <value>     Set a value (validated against the known schema)\n"
              << "  remove <key>          Remove a setting\n"
              << "  list                  List all settings\n"
              << "  check                 Report keys the schema does not know\n"
              << "  keys [key]            Show known keys, or suggestions for a key\n"
              << "  inspect               Print the file as rmqconf writes it\n"
              << "  version               Show version information\n\n"
              << "Options:\n"
              << "  -f, --file <file>     Configuration file (default: $" << CONF_FILE_ENV
              << " or ./" << DEFAULT_CONF_FILE << ")\n"
              << "  -l, --log-level <l>   Log level: trace/debug/info/warn/error/off\n"
              << "  -q, --quiet           Suppress log output\n"
              << "  -h, --help            Show help\n\n"
              << "Environment:\n"
              << "  RMQCONF_FILE          Configuration file\n"
              << "  RMQCONF_LOG_LEVEL     Log level (default: warn)\n"
              << "  RMQCONF_LOG_FILE      Also write logs to this file\n\n"
              << "Examples:\n"
              << "  " << program << " get 'listeners.tcp.*'\n"
              << "  " << program << " -f /etc/rabbitmq/rabbitmq.conf set heartbeat 30\n"
              << "  " << program << " check --json\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    CliContext ctx;
    if (const char* file = std::getenv(CONF_FILE_ENV)) {
        if (*file != '\0') ctx.conf_file = file;
    }

    log::init_from_env(log::Level::Warn);

    // Global options stop at the first non-option argument (the command)
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            ctx.conf_file = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            auto level = log::parse_level(argv[++i]);
            if (!level) {
                std::cerr << "Error: unknown log level: " << argv[i] << "\n";
                return 1;
            }
            log::set_level(*level);
        } else if (arg == "-q" || arg == "--quiet") {
            log::set_level(log::Level::Off);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        } else {
            break;
        }
    }

    if (i >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[i];
    int sub_argc = argc - i - 1;
    char** sub_argv = argv + i + 1;

    cli_log().debug("Command {} on {}", command, ctx.conf_file.string());

    int rc = 1;
    if (command == "get") rc = cmd_get(ctx, sub_argc, sub_argv);
    else if (command == "set") rc = cmd_set(ctx, sub_argc, sub_argv);
    else if (command == "remove" || command == "rm") rc = cmd_remove(ctx, sub_argc, sub_argv);
    else if (command == "list" || command == "ls") rc = cmd_list(ctx, sub_argc, sub_argv);
    else if (command == "check") rc = cmd_check(ctx, sub_argc, sub_argv);
    else if (command == "keys") rc = cmd_keys(sub_argc, sub_argv);
    else if (command == "inspect") rc = cmd_inspect(ctx, sub_argc, sub_argv);
    else if (command == "version") rc = cmd_version();
    else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
    }

    log::shutdown();
    return rc;
}

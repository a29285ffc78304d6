#include "cli_common.hpp"

using namespace rmqconf;

int cmd_version() {
    std::cout << "rmqconf " << version::VERSION << "\n"
              << "  Known keys: " << known_key_templates().size() << "\n"
              << "  Language:   C++23\n"
#ifdef _WIN32
              << "  Platform:   windows/"
#elif defined(__APPLE__)
              << "  Platform:   macos/"
#else
              << "  Platform:   linux/"
#endif
#if defined(__x86_64__) || defined(_M_X64)
              << "amd64\n";
#elif defined(__aarch64__) || defined(_M_ARM64)
              << "arm64\n";
#else
              << "unknown\n";
#endif
    return 0;
}

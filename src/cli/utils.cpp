#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace twbuild::cli {

bool take_option_value(int argc, char* argv[], int& i, std::string_view flag, std::string& value,
                       bool& missing) {
    std::string_view arg = argv[i];
    missing = false;

    if (arg == flag) {
        if (i + 1 >= argc) {
            missing = true;
            return true;
        }
        value = argv[++i];
        return true;
    }

    if (arg.size() > flag.size() && arg.starts_with(flag) && arg[flag.size()] == '=') {
        value = std::string(arg.substr(flag.size() + 1));
        missing = value.empty();
        return true;
    }
    return false;
}

void print_usage() {
    std::cout << "twbuild " << VERSION << "\n\n";
    std::cout << "Usage: twbuild <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  build     Install and compile Tailwind, or set up the JIT script\n";
    std::cout << "  render    Print the rendered Tailwind config\n";
    std::cout << "\nBuild options:\n";
    std::cout << "  --css PATH          Input stylesheet (must exist)\n";
    std::cout << "  --cdn URL           CDN script URL for JIT builds\n";
    std::cout << "  --config FILE       Tailwind config document (JSON)\n";
    std::cout << "  --src-dir DIR       Directory substituted for {src_dir}\n";
    std::cout << "  --always            Install and compile regardless of PROFILE\n";
    std::cout << "  --emit lines|cmake  Directive output format (default: lines)\n";
    std::cout << "  --cmake-out FILE    Write cmake directives to FILE instead of stdout\n";
    std::cout << "\nRender options:\n";
    std::cout << "  --target exports|jit  Wrapper to apply (default: exports)\n";
    std::cout << "  --config FILE         Tailwind config document (JSON)\n";
    std::cout << "  --src-dir DIR         Directory substituted for {src_dir}\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h          Show this help\n";
    std::cout << "  --version, -V       Show version\n";
    std::cout << "  -v, -vv, -q         Log verbosity\n";
    std::cout << "  --log-level=LEVEL   trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=SPEC   Per-module levels, e.g. install=debug,*=warn\n";
    std::cout << "  --log-file=FILE     Also write logs to FILE\n";
    std::cout << "  --log-format=FMT    text or json\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  OUT_DIR             Output directory (required for build)\n";
    std::cout << "  PROFILE             release or debug\n";
    std::cout << "  TWBUILD_LOG         Log level or filter spec\n";
}

void print_version() {
    std::cout << "twbuild " << VERSION << "\n";
}

} // namespace twbuild::cli

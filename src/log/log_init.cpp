//! # Log Initialization from CLI
//!
//! Turns logging flags and the TWBUILD_LOG environment value into a
//! LogConfig. The default level is Info so the pipeline's progress
//! ("creating package.json", "node_modules already exists, not installing")
//! is visible in build logs.

#include "log/log.hpp"

#include <algorithm>
#include <string>

namespace twbuild::log {

namespace {

/// Counts the v's in "-v", "-vv", "-vvv"; 0 for anything else.
int verbosity_of(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v') {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || verbosity_of(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[], const std::optional<std::string>& env_spec) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Warn;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else {
            v_count = std::max(v_count, verbosity_of(arg));
        }
    }

    // -v = Debug, -vv and beyond = Trace
    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 2 ? LogLevel::Trace : LogLevel::Debug;
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter && env_spec && !env_spec->empty()) {
        const std::string& env_str = *env_spec;
        if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
            config.filter_spec = env_str;
        } else {
            config.level = parse_level(env_str);
        }
    }

    return config;
}

} // namespace twbuild::log

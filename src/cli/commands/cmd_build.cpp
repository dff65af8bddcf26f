//! # Build Command
//!
//! ```text
//! twbuild build [--css PATH] [--cdn URL] [--config FILE.json] [--src-dir DIR]
//!               [--always] [--emit lines|cmake] [--cmake-out FILE]
//! ```
//!
//! Directives are printed even when the build fails, so warnings emitted
//! before the failure still reach the caller.

#include "cmd_build.hpp"

#include "build/file_ops.hpp"
#include "build/orchestrator.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>

namespace twbuild::cli {

namespace {

/// Flags that only change what `build` does.
bool is_build_only(std::string_view flag) {
    return flag == "--css" || flag == "--cdn" || flag == "--always" || flag == "--emit" ||
           flag == "--cmake-out";
}

std::string_view flag_name(std::string_view arg) {
    return arg.substr(0, arg.find('='));
}

} // namespace

Result<BuildCommandOptions, std::string> parse_build_args(int argc, char* argv[], int first,
                                                          CommandKind command) {
    BuildCommandOptions opts;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool missing = false;

        if (log::is_log_option(arg)) {
            continue;
        }

        std::string_view flag = flag_name(arg);
        if (command == CommandKind::Build && flag == "--target") {
            return "option '--target' is only accepted by 'twbuild render'";
        }
        if (command == CommandKind::Render && is_build_only(flag)) {
            return "option '" + std::string(flag) + "' is only accepted by 'twbuild build'";
        }

        if (arg == "--always") {
            opts.always = true;
            continue;
        }

        if (take_option_value(argc, argv, i, "--css", value, missing)) {
            opts.css_path = value;
        } else if (take_option_value(argc, argv, i, "--cdn", value, missing)) {
            opts.cdn_src = value;
        } else if (take_option_value(argc, argv, i, "--config", value, missing)) {
            opts.config_file = value;
        } else if (take_option_value(argc, argv, i, "--src-dir", value, missing)) {
            opts.src_dir = value;
        } else if (take_option_value(argc, argv, i, "--cmake-out", value, missing)) {
            opts.cmake_out = value;
        } else if (take_option_value(argc, argv, i, "--target", value, missing)) {
            opts.target = value;
        } else if (take_option_value(argc, argv, i, "--emit", value, missing)) {
            if (!missing) {
                auto format = build::parse_directive_format(value);
                if (!format) {
                    return "unknown directive format '" + value + "' (expected lines or cmake)";
                }
                opts.emit = *format;
            }
        } else {
            return "unknown option '" + arg + "'";
        }

        if (missing) {
            return "option '" + arg + "' requires a value";
        }
    }

    // --cmake-out only makes sense for the cmake format
    if (opts.cmake_out) {
        opts.emit = build::DirectiveFormat::CMake;
    }
    return opts;
}

Result<build::BuildConfig, build::BuildError> make_build_config(const BuildCommandOptions& opts) {
    build::BuildConfig config;

    if (opts.css_path) {
        config = config.with_path(build::fs::path(*opts.css_path));
    }
    if (opts.cdn_src) {
        config = config.with_cdn_src(*opts.cdn_src);
    }
    if (opts.config_file) {
        auto document = build::load_tw_config(*opts.config_file);
        if (is_err(document)) {
            return unwrap_err(document);
        }
        config = config.with_tw_config(unwrap(document));
    }
    if (opts.always) {
        config = config.always();
    }
    return config;
}

int run_build_with(const BuildCommandOptions& opts, const build::EnvironmentSnapshot& env,
                   build::ToolRunner& runner, std::ostream& out) {
    auto config = make_build_config(opts);
    if (is_err(config)) {
        TWBUILD_LOG_FATAL("cli", unwrap_err(config).to_string());
        return 1;
    }

    build::DirectiveSink directives;
    build::Orchestrator orchestrator(std::move(unwrap(config)), env, runner, directives);
    if (opts.src_dir) {
        orchestrator.set_source_dir(*opts.src_dir);
    }

    auto outcome = orchestrator.run();

    std::string rendered = directives.render(opts.emit);
    if (opts.cmake_out) {
        auto written = build::write_text_file(*opts.cmake_out, rendered);
        if (is_err(written)) {
            TWBUILD_LOG_FATAL("cli", unwrap_err(written).to_string());
            return 1;
        }
        TWBUILD_LOG_DEBUG("cli", "wrote directives to " << *opts.cmake_out);
    } else {
        out << rendered;
        out.flush();
    }

    if (is_err(outcome)) {
        TWBUILD_LOG_FATAL("cli", unwrap_err(outcome).to_string());
        return 1;
    }

    const auto& done = unwrap(outcome);
    TWBUILD_LOG_INFO("cli", build::pipeline_name(done.pipeline)
                                << " finished, " << done.written.size() << " file(s) written to "
                                << done.out_dir.string());
    return 0;
}

int run_build(int argc, char* argv[], const build::EnvironmentSnapshot& env) {
    auto opts = parse_build_args(argc, argv, 2, CommandKind::Build);
    if (is_err(opts)) {
        std::cerr << "Error: " << unwrap_err(opts) << "\n";
        std::cerr << "Run 'twbuild --help' for usage information.\n";
        return 1;
    }

    build::SystemToolRunner runner;
    return run_build_with(unwrap(opts), env, runner, std::cout);
}

} // namespace twbuild::cli

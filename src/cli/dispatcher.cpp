//! # CLI Command Dispatcher
//!
//! ```text
//! twbuild_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ build          → run_build()
//!   └─ render         → run_render()
//! ```
//!
//! The logger is configured from the log flags and `TWBUILD_LOG` before any
//! command runs. The process environment is captured once here and passed
//! down; nothing below this file reads the environment directly.

#include "build/environment.hpp"
#include "commands/cmd_build.hpp"
#include "commands/cmd_render.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace twbuild::cli {

/// Main entry point for the twbuild CLI.
///
/// | Code | Meaning                         |
/// |------|---------------------------------|
/// | 0    | Success                         |
/// | 1    | Usage error or build failure    |
int twbuild_main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    auto env = build::EnvironmentSnapshot::capture();
    log::Logger::init(log::parse_log_options(argc, argv, env.get(build::ENV_LOG)));

    if (command == "build") {
        return run_build(argc, argv, env);
    }

    if (command == "render") {
        return run_render(argc, argv, env);
    }

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::cerr << "Run 'twbuild --help' for usage information.\n";
    return 1;
}

} // namespace twbuild::cli

// Entry point wrapper (outside namespace)
int twbuild_main(int argc, char* argv[]) {
    return twbuild::cli::twbuild_main(argc, argv);
}

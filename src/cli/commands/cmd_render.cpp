#include "cmd_render.hpp"

#include "build/artifacts.hpp"
#include "build/template_renderer.hpp"
#include "log/log.hpp"

#include <iostream>
#include <system_error>

namespace twbuild::cli {

int run_render_with(const BuildCommandOptions& opts, const build::EnvironmentSnapshot& env,
                    std::ostream& out) {
    auto target = build::parse_config_target(opts.target);
    if (!target) {
        TWBUILD_LOG_FATAL("cli", "unknown render target '" << opts.target
                                                           << "' (expected exports or jit)");
        return 1;
    }

    auto config = make_build_config(opts);
    if (is_err(config)) {
        TWBUILD_LOG_FATAL("cli", unwrap_err(config).to_string());
        return 1;
    }

    build::fs::path src_dir = env.working_dir() / build::SOURCE_DIR;
    if (opts.src_dir) {
        build::fs::path override_dir(*opts.src_dir);
        src_dir = override_dir.is_absolute() ? override_dir : env.working_dir() / override_dir;
    }

    std::error_code ec;
    build::fs::path canonical = build::fs::canonical(src_dir, ec);
    if (ec) {
        TWBUILD_LOG_FATAL(
            "cli",
            build::BuildError::io("could not canonicalize source directory", src_dir, ec)
                .to_string());
        return 1;
    }

    auto rendered = build::render_config(unwrap(config).tw_config(), canonical);
    if (is_err(rendered)) {
        TWBUILD_LOG_FATAL("cli", unwrap_err(rendered).to_string());
        return 1;
    }

    out << build::wrap_config(unwrap(rendered).text, *target);
    out.flush();
    return 0;
}

int run_render(int argc, char* argv[], const build::EnvironmentSnapshot& env) {
    auto opts = parse_build_args(argc, argv, 2, CommandKind::Render);
    if (is_err(opts)) {
        std::cerr << "Error: " << unwrap_err(opts) << "\n";
        std::cerr << "Run 'twbuild --help' for usage information.\n";
        return 1;
    }
    return run_render_with(unwrap(opts), env, std::cout);
}

} // namespace twbuild::cli

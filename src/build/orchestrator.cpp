//! # Orchestrator Implementation
//!
//! Each step returns `Result<T, BuildError>` and the pipelines stop at the
//! first error. The output directory is treated as a cache: `package.json`
//! and `node_modules` are only checked for existence, while the config
//! files are rewritten on every run.

#include "build/orchestrator.hpp"

#include "build/file_ops.hpp"
#include "log/log.hpp"

#include <system_error>

namespace twbuild::build {

const char* pipeline_name(Pipeline pipeline) {
    switch (pipeline) {
    case Pipeline::InstallCompile:
        return "install-compile";
    case Pipeline::JitSetup:
        return "jit";
    }
    return "unknown";
}

Pipeline select_pipeline(BuildProfile profile, bool always) {
    if (is_release(profile) || always) {
        return Pipeline::InstallCompile;
    }
    return Pipeline::JitSetup;
}

Orchestrator::Orchestrator(BuildConfig config, const EnvironmentSnapshot& env, ToolRunner& runner,
                           DirectiveSink& directives)
    : config_(std::move(config)), env_(env), runner_(runner), directives_(directives) {}

fs::path Orchestrator::absolute_from_root(const fs::path& p) const {
    if (p.is_absolute()) {
        return p.lexically_normal();
    }
    return (env_.working_dir() / p).lexically_normal();
}

// ============================================================================
// Input Resolution
// ============================================================================

Result<fs::path, BuildError> Orchestrator::resolve_out_dir() const {
    auto out_dir = env_.get(ENV_OUT_DIR);
    if (!out_dir || out_dir->empty()) {
        return BuildError::make(BuildErrorKind::MissingEnv, "OUT_DIR not provided");
    }

    fs::path dir = absolute_from_root(*out_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return BuildError::io("cannot create output directory", dir, ec);
    }
    return dir;
}

Result<fs::path, BuildError> Orchestrator::resolve_src_dir() const {
    fs::path dir = source_dir_override_ ? absolute_from_root(*source_dir_override_)
                                        : env_.working_dir() / SOURCE_DIR;
    std::error_code ec;
    fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        return BuildError::io("could not canonicalize source directory", dir, ec);
    }
    return canonical;
}

Result<StylesheetSource, BuildError> Orchestrator::resolve_stylesheet() const {
    if (const auto& custom = config_.css_path()) {
        fs::path path = absolute_from_root(*custom);
        directives_.rerun_if_changed(path.string());
        if (!path_exists(path)) {
            return BuildError::make(BuildErrorKind::MissingStylesheet,
                                    "specified a css path but it does not exist", path);
        }
        return StylesheetSource{StylesheetOrigin::Custom, path};
    }

    fs::path root_style = env_.working_dir() / ROOT_STYLESHEET;
    if (path_exists(root_style)) {
        return StylesheetSource{StylesheetOrigin::Root, root_style};
    }
    return StylesheetSource{StylesheetOrigin::Builtin, {}};
}

// ============================================================================
// InstallCompile Steps
// ============================================================================

Result<bool, BuildError> Orchestrator::ensure_package_manifest(const ArtifactPaths& paths,
                                                               BuildOutcome& outcome) {
    if (path_exists(paths.package_json)) {
        TWBUILD_LOG_INFO("install", "package.json already exists, not creating another one");
        return false;
    }

    TWBUILD_LOG_INFO("install", "creating package.json (" << paths.package_json.string() << ")");
    auto written = write_text_file(paths.package_json, DEFAULT_PACKAGE_JSON);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    outcome.written.push_back(paths.package_json);
    return true;
}

Result<bool, BuildError> Orchestrator::ensure_toolchain(const ArtifactPaths& paths) {
    if (path_exists(paths.node_modules)) {
        TWBUILD_LOG_INFO("install", "node_modules already exists, not installing");
        return false;
    }

    TWBUILD_LOG_INFO("install", "installing tailwind");
    ToolInvocation npm{"npm", {"install"}, paths.out_dir};
    ToolResult result = runner_.run(npm);
    if (!result.success()) {
        return BuildError::make(BuildErrorKind::ToolInstall,
                                "tailwind could not be installed: " + result.error_message,
                                paths.out_dir);
    }
    return true;
}

Result<fs::path, BuildError> Orchestrator::write_config(const fs::path& target,
                                                        ConfigTarget wrapper,
                                                        const fs::path& src_dir,
                                                        BuildOutcome& outcome) {
    auto rendered = render_config(config_.tw_config(), src_dir);
    if (is_err(rendered)) {
        return unwrap_err(rendered);
    }

    auto written = write_text_file(target, wrap_config(unwrap(rendered).text, wrapper));
    if (is_err(written)) {
        return unwrap_err(written);
    }
    outcome.written.push_back(target);
    return target;
}

Result<fs::path, BuildError> Orchestrator::stage_stylesheet(const StylesheetSource& source,
                                                            const ArtifactPaths& paths,
                                                            BuildOutcome& outcome) {
    outcome.stylesheet = source.origin;

    if (source.origin == StylesheetOrigin::Builtin) {
        TWBUILD_LOG_INFO("compile", "creating default style.css");
        auto written = write_text_file(paths.style_in, DEFAULT_STYLE_CSS);
        if (is_err(written)) {
            return unwrap_err(written);
        }
    } else {
        TWBUILD_LOG_INFO("compile", "copying " << source.path.string() << " to build css");
        auto copied = copy_file_over(source.path, paths.style_in);
        if (is_err(copied)) {
            return unwrap_err(copied);
        }
    }

    outcome.written.push_back(paths.style_in);
    return paths.style_in;
}

Result<fs::path, BuildError> Orchestrator::compile_stylesheet(const ArtifactPaths& paths) {
    TWBUILD_LOG_INFO("compile", "building styles (" << paths.style_out.string() << ")");

    ToolInvocation npx{"npx",
                       {"tailwindcss", "-i", paths.style_in.string(), "-o",
                        paths.style_out.string(), "--minify"},
                       paths.out_dir};
    ToolResult result = runner_.run(npx);
    if (!result.success()) {
        return BuildError::make(BuildErrorKind::ToolCompile,
                                "could not build styles: " + result.error_message,
                                paths.style_in);
    }
    return paths.style_out;
}

// ============================================================================
// Pipelines
// ============================================================================

Result<bool, BuildError> Orchestrator::install_and_compile(const ArtifactPaths& paths,
                                                           const fs::path& src_dir,
                                                           BuildOutcome& outcome) {
    auto stylesheet = resolve_stylesheet();
    if (is_err(stylesheet)) {
        return unwrap_err(stylesheet);
    }

    auto manifest = ensure_package_manifest(paths, outcome);
    if (is_err(manifest)) {
        return unwrap_err(manifest);
    }
    outcome.manifest_created = unwrap(manifest);

    auto installed = ensure_toolchain(paths);
    if (is_err(installed)) {
        return unwrap_err(installed);
    }
    outcome.toolchain_installed = unwrap(installed);

    TWBUILD_LOG_INFO("install", "writing tailwind config (" << paths.tailwind_config.string()
                                                            << ")");
    auto config = write_config(paths.tailwind_config, ConfigTarget::ModuleExports, src_dir, outcome);
    if (is_err(config)) {
        return unwrap_err(config);
    }

    auto staged = stage_stylesheet(unwrap(stylesheet), paths, outcome);
    if (is_err(staged)) {
        return unwrap_err(staged);
    }

    auto compiled = compile_stylesheet(paths);
    if (is_err(compiled)) {
        return unwrap_err(compiled);
    }

    directives_.set_env(ENV_TAILWIND_PATH, unwrap(compiled).string());
    return true;
}

Result<bool, BuildError> Orchestrator::setup_jit(const ArtifactPaths& paths,
                                                 const fs::path& src_dir, BuildOutcome& outcome) {
    TWBUILD_LOG_INFO("jit", "writing jit config (" << paths.jit_config.string() << ")");
    auto script = write_config(paths.jit_config, ConfigTarget::JitGlobal, src_dir, outcome);
    if (is_err(script)) {
        return unwrap_err(script);
    }

    directives_.set_env(ENV_JIT_CONFIG_PATH, unwrap(script).string());
    directives_.set_env(ENV_JIT_URL, config_.cdn_src());
    return true;
}

Result<BuildOutcome, BuildError> Orchestrator::run() {
    auto out_dir = resolve_out_dir();
    if (is_err(out_dir)) {
        return unwrap_err(out_dir);
    }

    auto src_dir = resolve_src_dir();
    if (is_err(src_dir)) {
        return unwrap_err(src_dir);
    }

    BuildProfile profile = detect_profile(env_, directives_);
    Pipeline pipeline = select_pipeline(profile, config_.is_always());

    TWBUILD_LOG_DEBUG("build", "profile " << profile_name(profile) << ", always "
                                          << (config_.is_always() ? "on" : "off") << " -> "
                                          << pipeline_name(pipeline));

    BuildOutcome outcome{pipeline, profile, unwrap(out_dir), unwrap(src_dir), {}, false, false, {}};
    ArtifactPaths paths = ArtifactPaths::in(outcome.out_dir);

    auto done = pipeline == Pipeline::InstallCompile
                    ? install_and_compile(paths, outcome.src_dir, outcome)
                    : setup_jit(paths, outcome.src_dir, outcome);
    if (is_err(done)) {
        return unwrap_err(done);
    }
    return outcome;
}

Result<BuildOutcome, BuildError> build_tailwind(const EnvironmentSnapshot& env, ToolRunner& runner,
                                                DirectiveSink& directives) {
    Orchestrator orchestrator(BuildConfig(), env, runner, directives);
    return orchestrator.run();
}

} // namespace twbuild::build

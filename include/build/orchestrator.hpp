//! # Tailwind Build Orchestrator
//!
//! Chooses between the two delivery modes and runs the matching pipeline.
//!
//! ```text
//! Start ─┬─ release || always ─→ InstallCompile ─┬─→ Done
//!        └─ otherwise ─────────→ JitSetup ───────┴─→ Failed (BuildError)
//! ```
//!
//! ## InstallCompile
//!
//! 1. Resolve the input stylesheet (a missing custom path fails here, before
//!    any tool runs)
//! 2. Write `package.json` if absent
//! 3. Run `npm install` if `node_modules` is absent
//! 4. Render and write `tailwind.config.js`
//! 5. Copy or synthesize `style.in.css`
//! 6. Run `npx tailwindcss -i style.in.css -o style.css --minify`
//! 7. Emit `INCLUDE_TAILWIND_PATH`
//!
//! ## JitSetup
//!
//! Render and write `jit_config.js`, then emit
//! `INCLUDE_TAILWIND_JIT_CONFIG_PATH` and `INCLUDE_TAILWIND_JIT_URL`. No tool
//! is run.

#ifndef TWBUILD_BUILD_ORCHESTRATOR_HPP
#define TWBUILD_BUILD_ORCHESTRATOR_HPP

#include "build/artifacts.hpp"
#include "build/build_config.hpp"
#include "build/directives.hpp"
#include "build/environment.hpp"
#include "build/error.hpp"
#include "build/profile.hpp"
#include "build/template_renderer.hpp"
#include "build/tool_runner.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace twbuild::build {

namespace fs = std::filesystem;

enum class Pipeline {
    InstallCompile,
    JitSetup,
};

const char* pipeline_name(Pipeline pipeline);

/// InstallCompile iff the profile is Release or `always` is set.
Pipeline select_pipeline(BuildProfile profile, bool always);

/// Where `style.in.css` comes from.
enum class StylesheetOrigin {
    Custom,  ///< The configured path
    Root,    ///< `style.css` at the project root
    Builtin, ///< DEFAULT_STYLE_CSS
};

struct StylesheetSource {
    StylesheetOrigin origin;
    fs::path path; ///< Empty for Builtin
};

struct BuildOutcome {
    Pipeline pipeline;
    BuildProfile profile;
    fs::path out_dir;
    fs::path src_dir;
    std::vector<fs::path> written; ///< Files written, in order
    bool manifest_created = false;
    bool toolchain_installed = false;
    std::optional<StylesheetOrigin> stylesheet; ///< InstallCompile only
};

class Orchestrator {
public:
    Orchestrator(BuildConfig config, const EnvironmentSnapshot& env, ToolRunner& runner,
                 DirectiveSink& directives);

    /// Overrides `<project root>/src` as the directory substituted for `{src_dir}`.
    void set_source_dir(fs::path dir) {
        source_dir_override_ = std::move(dir);
    }

    /// Detects the profile, selects a pipeline and runs it.
    Result<BuildOutcome, BuildError> run();

    /// Absolute, canonical source directory.
    [[nodiscard]] Result<fs::path, BuildError> resolve_src_dir() const;

    /// Absolute output directory from OUT_DIR.
    [[nodiscard]] Result<fs::path, BuildError> resolve_out_dir() const;

private:
    BuildConfig config_;
    EnvironmentSnapshot env_;
    ToolRunner& runner_;
    DirectiveSink& directives_;
    std::optional<fs::path> source_dir_override_;

    fs::path absolute_from_root(const fs::path& p) const;

    Result<StylesheetSource, BuildError> resolve_stylesheet() const;
    Result<bool, BuildError> ensure_package_manifest(const ArtifactPaths& paths,
                                                     BuildOutcome& outcome);
    Result<bool, BuildError> ensure_toolchain(const ArtifactPaths& paths);
    Result<fs::path, BuildError> write_config(const fs::path& target, ConfigTarget wrapper,
                                              const fs::path& src_dir, BuildOutcome& outcome);
    Result<fs::path, BuildError> stage_stylesheet(const StylesheetSource& source,
                                                  const ArtifactPaths& paths,
                                                  BuildOutcome& outcome);
    Result<fs::path, BuildError> compile_stylesheet(const ArtifactPaths& paths);

    Result<bool, BuildError> install_and_compile(const ArtifactPaths& paths,
                                                 const fs::path& src_dir, BuildOutcome& outcome);
    Result<bool, BuildError> setup_jit(const ArtifactPaths& paths, const fs::path& src_dir,
                                       BuildOutcome& outcome);
};

/// Runs the orchestrator with the default configuration.
Result<BuildOutcome, BuildError> build_tailwind(const EnvironmentSnapshot& env, ToolRunner& runner,
                                                DirectiveSink& directives);

} // namespace twbuild::build

#endif // TWBUILD_BUILD_ORCHESTRATOR_HPP

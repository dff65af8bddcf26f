//! # Build Artifacts
//!
//! Everything the orchestrator writes lives in one output directory, which
//! doubles as a cache between runs:
//!
//! ```text
//! $OUT_DIR/
//!   ├─ package.json        # created once, never overwritten
//!   ├─ node_modules/       # presence skips `npm install`
//!   ├─ tailwind.config.js  # rewritten every release run
//!   ├─ style.in.css        # input stylesheet copy
//!   ├─ style.css           # minified output
//!   └─ jit_config.js       # rewritten every JIT run
//! ```

#ifndef TWBUILD_BUILD_ARTIFACTS_HPP
#define TWBUILD_BUILD_ARTIFACTS_HPP

#include <filesystem>

namespace twbuild::build {

namespace fs = std::filesystem;

/// Manifest written when `package.json` is absent. Users may edit the pinned
/// version; the file is never regenerated while it exists.
constexpr const char* DEFAULT_PACKAGE_JSON = R"({
    "name": "include-tailwind",
    "version": "1.0.0",
    "description": "the autogenerated package.json for include-tailwind",
    "devDependencies": {
        "tailwindcss": "^3.4.4"
    }
}
)";

/// Input stylesheet used when neither a custom nor a root `style.css` exists.
constexpr const char* DEFAULT_STYLE_CSS = R"(
@tailwind base;
@tailwind components;
@tailwind utilities;
)";

/// Conventional stylesheet name looked up at the project root.
constexpr const char* ROOT_STYLESHEET = "style.css";

/// Directory holding the project sources, relative to the project root.
constexpr const char* SOURCE_DIR = "src";

struct ArtifactPaths {
    fs::path out_dir;
    fs::path package_json;
    fs::path node_modules;
    fs::path tailwind_config;
    fs::path style_in;
    fs::path style_out;
    fs::path jit_config;

    static ArtifactPaths in(const fs::path& out_dir) {
        return ArtifactPaths{
            out_dir,
            out_dir / "package.json",
            out_dir / "node_modules",
            out_dir / "tailwind.config.js",
            out_dir / "style.in.css",
            out_dir / "style.css",
            out_dir / "jit_config.js",
        };
    }
};

} // namespace twbuild::build

#endif // TWBUILD_BUILD_ARTIFACTS_HPP

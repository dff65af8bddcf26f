//! # Build Configuration
//!
//! `BuildConfig` is the immutable set of user options for one orchestrator
//! run. Every `with_*` method is `const` and returns a modified copy, so a
//! config can be assembled by chaining and never changes once built:
//!
//! ```cpp
//! auto config = BuildConfig()
//!                   .with_path(fs::path("assets/app.css"))
//!                   .with_cdn_src("https://my.cdn.example/tailwind.js")
//!                   .always();
//! ```
//!
//! ## Defaults
//!
//! | Option | Default |
//! |--------|---------|
//! | `css_path` | none: use `style.css` at the project root, else the built-in stylesheet |
//! | `cdn_src` | `https://cdn.tailwindcss.com` |
//! | `tw_config` | `{"content": ["{src_dir}/**/*.{html,js,rs}"], "theme": {"extend": {}}, "plugins": []}` |
//! | `always` | `false` |
//!
//! No validation happens here. The document is only checked when it is
//! rendered.

#ifndef TWBUILD_BUILD_BUILD_CONFIG_HPP
#define TWBUILD_BUILD_BUILD_CONFIG_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace twbuild::build {

namespace fs = std::filesystem;

/// Default CDN script used by JIT builds.
constexpr const char* DEFAULT_CDN_SRC = "https://cdn.tailwindcss.com";

/// Placeholder replaced with the canonical source directory when rendering.
constexpr const char* SRC_DIR_TOKEN = "{src_dir}";

/// The stock Tailwind config document.
json::JsonValue default_tw_config();

class BuildConfig {
public:
    BuildConfig();

    BuildConfig(const BuildConfig& other);
    BuildConfig& operator=(const BuildConfig& other);
    BuildConfig(BuildConfig&&) noexcept = default;
    BuildConfig& operator=(BuildConfig&&) noexcept = default;

    /// Sets or clears the custom stylesheet. A set path must exist at build time.
    [[nodiscard]] BuildConfig with_path(std::optional<fs::path> path) const;

    /// CDN script URL for JIT builds.
    [[nodiscard]] BuildConfig with_cdn_src(std::string src) const;

    /// Replaces the Tailwind config document.
    [[nodiscard]] BuildConfig with_tw_config(const json::JsonValue& config) const;

    /// Forces the install-and-compile pipeline regardless of profile.
    [[nodiscard]] BuildConfig always() const;

    [[nodiscard]] const std::optional<fs::path>& css_path() const {
        return css_path_;
    }

    [[nodiscard]] bool is_always() const {
        return always_;
    }

    [[nodiscard]] const json::JsonValue& tw_config() const {
        return tw_config_;
    }

    [[nodiscard]] const std::string& cdn_src() const {
        return cdn_src_;
    }

private:
    std::optional<fs::path> css_path_;
    bool always_ = false;
    json::JsonValue tw_config_;
    std::string cdn_src_;
};

/// Reads a Tailwind config document from a JSON file. Fails with `Io` when
/// the file cannot be read and `InvalidConfig` when it does not parse.
Result<json::JsonValue, BuildError> load_tw_config(const fs::path& path);

} // namespace twbuild::build

#endif // TWBUILD_BUILD_BUILD_CONFIG_HPP

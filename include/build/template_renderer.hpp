//! # Config Template Renderer
//!
//! Both pipelines produce the Tailwind config from the same document through
//! the same function, so development and release builds scan the same
//! content globs.
//!
//! ## Rendering
//!
//! 1. The document is pretty-printed with 2-space indentation.
//! 2. Every occurrence of the literal `{src_dir}` in that text is replaced
//!    with the canonical source directory.
//!
//! The replacement is textual: the token is found wherever it occurs in the
//! serialized text, whether inside a key or a value. Because serialized JSON
//! can only contain `{src_dir}` inside a string literal, the directory is
//! escaped as JSON string content before insertion. A path containing `"` or
//! `\` therefore still yields a valid document.
//!
//! ## Wrappers
//!
//! | Target | Output |
//! |--------|--------|
//! | `ModuleExports` | `module.exports = <config>` (`tailwind.config.js`) |
//! | `JitGlobal` | `tailwind.config = <config>` (`jit_config.js`) |

#ifndef TWBUILD_BUILD_TEMPLATE_RENDERER_HPP
#define TWBUILD_BUILD_TEMPLATE_RENDERER_HPP

#include "build/error.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace twbuild::build {

namespace fs = std::filesystem;

enum class ConfigTarget {
    ModuleExports,
    JitGlobal,
};

/// Parses "exports" or "jit".
std::optional<ConfigTarget> parse_config_target(std::string_view name);

struct RenderedConfig {
    std::string text;          ///< Pretty JSON with every token substituted
    size_t substitutions = 0;  ///< Number of tokens replaced
};

/// Number of non-overlapping `{src_dir}` occurrences in `text`.
size_t count_placeholders(std::string_view text);

/// True when `bytes` is well-formed UTF-8.
bool is_valid_utf8(std::string_view bytes);

/// Serializes `document` and substitutes the source directory. Fails with
/// `InvalidSrcPath` when `src_dir` is not valid UTF-8.
Result<RenderedConfig, BuildError> render_config(const json::JsonValue& document,
                                                 const fs::path& src_dir);

/// Wraps rendered config text for its destination file.
std::string wrap_config(std::string_view config_text, ConfigTarget target);

} // namespace twbuild::build

#endif // TWBUILD_BUILD_TEMPLATE_RENDERER_HPP

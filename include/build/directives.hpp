//! # Build Directives
//!
//! Directives are the orchestrator's output contract with the build system
//! that invoked it: environment values to expose to the application build,
//! cache-invalidation hints, and warnings. They are recorded in order in a
//! `DirectiveSink` and rendered once at the end of a run.
//!
//! ## Formats
//!
//! | Directive | `lines` | `cmake` |
//! |-----------|---------|---------|
//! | Warning | `twbuild:warning=MSG` | `message(WARNING "MSG")` |
//! | RerunIfEnvChanged | `twbuild:rerun-if-env-changed=NAME` | comment |
//! | RerunIfChanged | `twbuild:rerun-if-changed=PATH` | `set_property(... CMAKE_CONFIGURE_DEPENDS "PATH")` |
//! | SetEnv | `twbuild:env=NAME=VALUE` | `set(NAME "VALUE")` |

#ifndef TWBUILD_BUILD_DIRECTIVES_HPP
#define TWBUILD_BUILD_DIRECTIVES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace twbuild::build {

/// Exposes the compiled stylesheet's absolute path (InstallCompile).
constexpr const char* ENV_TAILWIND_PATH = "INCLUDE_TAILWIND_PATH";

/// Exposes the generated JIT config script's path (JitSetup).
constexpr const char* ENV_JIT_CONFIG_PATH = "INCLUDE_TAILWIND_JIT_CONFIG_PATH";

/// Exposes the CDN script URL (JitSetup).
constexpr const char* ENV_JIT_URL = "INCLUDE_TAILWIND_JIT_URL";

enum class DirectiveKind {
    Warning,
    RerunIfEnvChanged,
    RerunIfChanged,
    SetEnv,
};

struct Directive {
    DirectiveKind kind;
    std::string key;   ///< Variable name for SetEnv/RerunIfEnvChanged, path for RerunIfChanged
    std::string value; ///< Value for SetEnv, message for Warning

    bool operator==(const Directive& other) const = default;
};

enum class DirectiveFormat {
    Lines,
    CMake,
};

/// Parses "lines" or "cmake".
std::optional<DirectiveFormat> parse_directive_format(std::string_view name);

/// Ordered collection of directives emitted during one run.
class DirectiveSink {
public:
    void warning(std::string message);
    void rerun_if_env_changed(std::string name);
    void rerun_if_changed(std::string path);
    void set_env(std::string name, std::string value);

    [[nodiscard]] const std::vector<Directive>& directives() const {
        return directives_;
    }

    /// All directives of `kind`, in emission order.
    [[nodiscard]] std::vector<Directive> of_kind(DirectiveKind kind) const;

    /// Value of the last SetEnv for `name`.
    [[nodiscard]] std::optional<std::string> env(std::string_view name) const;

    /// Renders every directive in `format`, one per line.
    [[nodiscard]] std::string render(DirectiveFormat format) const;

private:
    std::vector<Directive> directives_;
};

} // namespace twbuild::build

#endif // TWBUILD_BUILD_DIRECTIVES_HPP

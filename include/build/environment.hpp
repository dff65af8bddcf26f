//! # Environment Snapshot
//!
//! The orchestrator never calls `getenv` or `current_path` itself. The CLI
//! captures the process environment once into an `EnvironmentSnapshot` and
//! passes it down, so profile detection and artifact placement are pure
//! functions of their inputs and tests can build snapshots by hand.
//!
//! ```cpp
//! auto env = EnvironmentSnapshot::capture();          // real process
//! auto env = EnvironmentSnapshot({{"PROFILE", "release"},
//!                                 {"OUT_DIR", "/tmp/out"}},
//!                                "/home/me/project"); // tests
//! ```

#ifndef TWBUILD_BUILD_ENVIRONMENT_HPP
#define TWBUILD_BUILD_ENVIRONMENT_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <system_error>

namespace twbuild::build {

namespace fs = std::filesystem;

/// Variable holding the build profile name.
constexpr const char* ENV_PROFILE = "PROFILE";

/// Variable holding the output directory. Required.
constexpr const char* ENV_OUT_DIR = "OUT_DIR";

/// Variable holding the logging level or filter spec.
constexpr const char* ENV_LOG = "TWBUILD_LOG";

class EnvironmentSnapshot {
public:
    EnvironmentSnapshot() = default;

    EnvironmentSnapshot(std::map<std::string, std::string> vars, fs::path working_dir)
        : vars_(std::move(vars)), working_dir_(std::move(working_dir)) {}

    /// Copies the current process environment and working directory.
    static EnvironmentSnapshot capture();

    /// Working directory used when `current_path` fails with `ec`. Logs a warning.
    static fs::path fallback_working_dir(const std::error_code& ec);

    /// Value of `name`, or nullopt when unset.
    [[nodiscard]] std::optional<std::string> get(const std::string& name) const;

    /// Directory the build was started from; the project root.
    [[nodiscard]] const fs::path& working_dir() const {
        return working_dir_;
    }

    /// Copy of this snapshot with `name` set to `value`.
    [[nodiscard]] EnvironmentSnapshot with(const std::string& name, std::string value) const;

    /// Copy of this snapshot with `name` removed.
    [[nodiscard]] EnvironmentSnapshot without(const std::string& name) const;

private:
    std::map<std::string, std::string> vars_;
    fs::path working_dir_;
};

} // namespace twbuild::build

#endif // TWBUILD_BUILD_ENVIRONMENT_HPP

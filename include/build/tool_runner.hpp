//! # External Tool Runner
//!
//! `npm` and `npx` are run through the `ToolRunner` interface so the
//! orchestrator can be tested with a recording runner. `SystemToolRunner`
//! is the real implementation: it builds a shell command line, changes into
//! the working directory and runs it with `std::system`, blocking until the
//! tool exits. Programs are found through the shell's `PATH` lookup.
//!
//! There is no timeout and no retry. A tool that hangs hangs the build.

#ifndef TWBUILD_BUILD_TOOL_RUNNER_HPP
#define TWBUILD_BUILD_TOOL_RUNNER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace twbuild::build {

namespace fs = std::filesystem;

struct ToolInvocation {
    std::string program;
    std::vector<std::string> args;
    fs::path working_dir;

    /// "program arg1 arg2", unquoted, for log messages.
    [[nodiscard]] std::string display() const;
};

struct ToolResult {
    bool launched = false; ///< The shell ran and reported a status
    int exit_code = -1;
    std::string error_message;

    [[nodiscard]] bool success() const {
        return launched && exit_code == 0;
    }
};

class ToolRunner {
public:
    virtual ~ToolRunner() = default;

    virtual ToolResult run(const ToolInvocation& invocation) = 0;
};

class SystemToolRunner : public ToolRunner {
public:
    ToolResult run(const ToolInvocation& invocation) override;

    /// The full shell command line `run` would execute.
    static std::string command_line(const ToolInvocation& invocation);
};

/// Quotes `arg` for the platform shell when it contains anything besides
/// letters, digits and `-_./:=@+,`.
std::string shell_quote(const std::string& arg);

} // namespace twbuild::build

#endif // TWBUILD_BUILD_TOOL_RUNNER_HPP

#include "build/tool_runner.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <sstream>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace twbuild::build {

namespace {

bool is_shell_safe(char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
    case '-':
    case '_':
    case '.':
    case '/':
    case ':':
    case '=':
    case '@':
    case '+':
    case ',':
        return true;
    default:
        return false;
    }
}

} // namespace

std::string shell_quote(const std::string& arg) {
    bool safe = !arg.empty();
    for (char c : arg) {
        if (!is_shell_safe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return arg;
    }

#ifdef _WIN32
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
#else
    // Single quotes disable every expansion; embedded ' becomes '\''
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
#endif
}

std::string ToolInvocation::display() const {
    std::string out = program;
    for (const auto& arg : args) {
        out += ' ';
        out += arg;
    }
    return out;
}

std::string SystemToolRunner::command_line(const ToolInvocation& invocation) {
    std::ostringstream cmd;
    if (!invocation.working_dir.empty()) {
#ifdef _WIN32
        cmd << "cd /d " << shell_quote(invocation.working_dir.string()) << " && ";
#else
        cmd << "cd " << shell_quote(invocation.working_dir.string()) << " && ";
#endif
    }
    cmd << shell_quote(invocation.program);
    for (const auto& arg : invocation.args) {
        cmd << ' ' << shell_quote(arg);
    }
    return cmd.str();
}

ToolResult SystemToolRunner::run(const ToolInvocation& invocation) {
    ToolResult result;
    std::string command = command_line(invocation);

    TWBUILD_LOG_DEBUG("tools", "running: " << command);

    int status = std::system(command.c_str());
    if (status == -1) {
        result.error_message = "could not start a shell for: " + invocation.display();
        return result;
    }

#ifdef _WIN32
    result.launched = true;
    result.exit_code = status;
#else
    if (WIFEXITED(status)) {
        result.launched = true;
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127) {
            result.error_message = invocation.program + " was not found on PATH";
        }
    } else if (WIFSIGNALED(status)) {
        result.launched = true;
        result.exit_code = 128 + WTERMSIG(status);
        result.error_message = invocation.program + " was killed by signal " +
                               std::to_string(WTERMSIG(status));
    } else {
        result.error_message = "unexpected wait status " + std::to_string(status);
    }
#endif

    if (result.launched && result.exit_code != 0 && result.error_message.empty()) {
        result.error_message =
            invocation.display() + " exited with code " + std::to_string(result.exit_code);
    }

    TWBUILD_LOG_DEBUG("tools", invocation.program << " finished with code " << result.exit_code);
    return result;
}

} // namespace twbuild::build

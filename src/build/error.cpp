#include "build/error.hpp"

namespace twbuild::build {

const char* error_kind_name(BuildErrorKind kind) {
    switch (kind) {
    case BuildErrorKind::Io:
        return "io";
    case BuildErrorKind::InvalidSrcPath:
        return "invalid-src-path";
    case BuildErrorKind::MissingEnv:
        return "missing-env";
    case BuildErrorKind::MissingStylesheet:
        return "missing-stylesheet";
    case BuildErrorKind::ToolInstall:
        return "tool-install";
    case BuildErrorKind::ToolCompile:
        return "tool-compile";
    case BuildErrorKind::InvalidConfig:
        return "invalid-config";
    }
    return "unknown";
}

std::string BuildError::to_string() const {
    std::string result = std::string(error_kind_name(kind)) + ": " + message;
    if (!path.empty()) {
        result += " (" + path.string() + ")";
    }
    return result;
}

} // namespace twbuild::build

#include "build/environment.hpp"

#include "log/log.hpp"

#include <system_error>

#ifdef _WIN32
#include <stdlib.h>
#else
extern char** environ;
#endif

namespace twbuild::build {

EnvironmentSnapshot EnvironmentSnapshot::capture() {
    std::map<std::string, std::string> vars;

#ifdef _WIN32
    char** entries = _environ;
#else
    char** entries = environ;
#endif
    for (char** entry = entries; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv = *entry;
        auto eq = kv.find('=');
        // Windows keeps per-drive cwd entries like "=C:=C:\\" which have an empty name
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        vars.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        cwd = fallback_working_dir(ec);
    }

    return EnvironmentSnapshot(std::move(vars), std::move(cwd));
}

fs::path EnvironmentSnapshot::fallback_working_dir(const std::error_code& ec) {
    TWBUILD_LOG_WARN("build", "could not read the working directory (" << ec.message()
                                                                       << "), using '.'");
    return ".";
}

std::optional<std::string> EnvironmentSnapshot::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

EnvironmentSnapshot EnvironmentSnapshot::with(const std::string& name, std::string value) const {
    EnvironmentSnapshot copy = *this;
    copy.vars_[name] = std::move(value);
    return copy;
}

EnvironmentSnapshot EnvironmentSnapshot::without(const std::string& name) const {
    EnvironmentSnapshot copy = *this;
    copy.vars_.erase(name);
    return copy;
}

} // namespace twbuild::build

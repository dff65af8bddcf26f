#include "build/profile.hpp"

#include "log/log.hpp"

namespace twbuild::build {

const char* profile_name(BuildProfile profile) {
    switch (profile) {
    case BuildProfile::Release:
        return "release";
    case BuildProfile::Debug:
        return "debug";
    case BuildProfile::Unknown:
        return "unknown";
    }
    return "unknown";
}

BuildProfile detect_profile(const EnvironmentSnapshot& env, DirectiveSink& directives) {
    directives.rerun_if_env_changed(ENV_PROFILE);

    auto value = env.get(ENV_PROFILE);
    if (!value) {
        std::string msg = "'PROFILE' was not defined, defaulting to debug";
        TWBUILD_LOG_WARN("profile", msg);
        directives.warning(std::move(msg));
        return BuildProfile::Unknown;
    }

    if (*value == "release") {
        return BuildProfile::Release;
    }
    if (*value == "debug") {
        return BuildProfile::Debug;
    }

    std::string msg = "'PROFILE' was neither release nor debug ('" + *value + "')";
    TWBUILD_LOG_WARN("profile", msg);
    directives.warning(std::move(msg));
    return BuildProfile::Unknown;
}

} // namespace twbuild::build

//! # Build Profile Detection
//!
//! The profile decides which pipeline runs. It comes from the `PROFILE`
//! environment variable and is resolved once per invocation.
//!
//! | `PROFILE` | Result | Warning |
//! |-----------|--------|---------|
//! | `release` | `Release` | - |
//! | `debug` | `Debug` | - |
//! | any other value | `Unknown` | `'PROFILE' was neither release nor debug ('<v>')` |
//! | unset | `Unknown` | `'PROFILE' was not defined, defaulting to debug` |
//!
//! `Unknown` behaves exactly like `Debug`. An unrecognized profile never
//! fails the build.

#ifndef TWBUILD_BUILD_PROFILE_HPP
#define TWBUILD_BUILD_PROFILE_HPP

#include "build/directives.hpp"
#include "build/environment.hpp"

namespace twbuild::build {

enum class BuildProfile {
    Release,
    Debug,
    Unknown,
};

const char* profile_name(BuildProfile profile);

/// Reads `PROFILE` from `env`. Always emits `rerun-if-env-changed=PROFILE`,
/// plus a warning when the value is missing or unrecognized.
BuildProfile detect_profile(const EnvironmentSnapshot& env, DirectiveSink& directives);

inline bool is_release(BuildProfile profile) {
    return profile == BuildProfile::Release;
}

} // namespace twbuild::build

#endif // TWBUILD_BUILD_PROFILE_HPP

//! # Profile Detection and Pipeline Selection Tests

#include "build/directives.hpp"
#include "build/environment.hpp"
#include "build/orchestrator.hpp"
#include "build/profile.hpp"

#include <gtest/gtest.h>

using namespace twbuild::build;

namespace {

EnvironmentSnapshot env_with_profile(const char* value) {
    EnvironmentSnapshot env({}, "/project");
    return value ? env.with(ENV_PROFILE, value) : env;
}

} // namespace

// ============================================================================
// detect_profile
// ============================================================================

TEST(ProfileTest, Release) {
    DirectiveSink directives;
    EXPECT_EQ(detect_profile(env_with_profile("release"), directives), BuildProfile::Release);
    EXPECT_TRUE(directives.of_kind(DirectiveKind::Warning).empty());
}

TEST(ProfileTest, Debug) {
    DirectiveSink directives;
    EXPECT_EQ(detect_profile(env_with_profile("debug"), directives), BuildProfile::Debug);
    EXPECT_TRUE(directives.of_kind(DirectiveKind::Warning).empty());
}

TEST(ProfileTest, UnrecognizedValueWarns) {
    DirectiveSink directives;
    EXPECT_EQ(detect_profile(env_with_profile("bench"), directives), BuildProfile::Unknown);

    auto warnings = directives.of_kind(DirectiveKind::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].value, "'PROFILE' was neither release nor debug ('bench')");
}

TEST(ProfileTest, ValueIsCaseSensitive) {
    DirectiveSink directives;
    EXPECT_EQ(detect_profile(env_with_profile("Release"), directives), BuildProfile::Unknown);
}

TEST(ProfileTest, MissingValueWarns) {
    DirectiveSink directives;
    EXPECT_EQ(detect_profile(env_with_profile(nullptr), directives), BuildProfile::Unknown);

    auto warnings = directives.of_kind(DirectiveKind::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].value, "'PROFILE' was not defined, defaulting to debug");
}

TEST(ProfileTest, AlwaysRequestsRerunOnProfileChange) {
    for (const char* value : {"release", "debug", "other"}) {
        DirectiveSink directives;
        (void)detect_profile(env_with_profile(value), directives);

        ASSERT_FALSE(directives.directives().empty());
        EXPECT_EQ(directives.directives()[0],
                  (Directive{DirectiveKind::RerunIfEnvChanged, "PROFILE", ""}));
    }

    DirectiveSink directives;
    (void)detect_profile(env_with_profile(nullptr), directives);
    EXPECT_EQ(directives.of_kind(DirectiveKind::RerunIfEnvChanged).size(), 1u);
}

TEST(ProfileTest, OnlyReleaseIsRelease) {
    EXPECT_TRUE(is_release(BuildProfile::Release));
    EXPECT_FALSE(is_release(BuildProfile::Debug));
    EXPECT_FALSE(is_release(BuildProfile::Unknown));
}

// ============================================================================
// select_pipeline
// ============================================================================

TEST(PipelineSelectionTest, Matrix) {
    EXPECT_EQ(select_pipeline(BuildProfile::Release, false), Pipeline::InstallCompile);
    EXPECT_EQ(select_pipeline(BuildProfile::Release, true), Pipeline::InstallCompile);
    EXPECT_EQ(select_pipeline(BuildProfile::Debug, true), Pipeline::InstallCompile);
    EXPECT_EQ(select_pipeline(BuildProfile::Debug, false), Pipeline::JitSetup);
    EXPECT_EQ(select_pipeline(BuildProfile::Unknown, false), Pipeline::JitSetup);
    EXPECT_EQ(select_pipeline(BuildProfile::Unknown, true), Pipeline::InstallCompile);
}

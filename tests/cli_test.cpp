//! # CLI Command Tests
//!
//! Argument parsing and the `build` and `render` commands, run with a spy
//! tool runner and string streams instead of the process environment.

#include "cli/commands/cmd_build.hpp"
#include "cli/commands/cmd_render.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace twbuild;
using namespace twbuild::cli;
using twbuild::test::Argv;
using twbuild::test::read_file;
using twbuild::test::SpyToolRunner;
using twbuild::test::TempDir;
using twbuild::test::write_file;

namespace fs = std::filesystem;

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(BuildArgsTest, ParsesAllOptions) {
    Argv args{"twbuild", "build",          "--css",     "assets/app.css", "--cdn=https://x/tw.js",
              "--always", "--config",      "tw.json",   "--src-dir",      "web",
              "-v",       "--emit=cmake"};
    auto result = parse_build_args(args.argc(), args.argv(), 2, CommandKind::Build);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);

    const auto& opts = unwrap(result);
    EXPECT_EQ(opts.css_path, "assets/app.css");
    EXPECT_EQ(opts.cdn_src, "https://x/tw.js");
    EXPECT_EQ(opts.config_file, "tw.json");
    EXPECT_EQ(opts.src_dir, "web");
    EXPECT_TRUE(opts.always);
    EXPECT_EQ(opts.emit, build::DirectiveFormat::CMake);
}

TEST(BuildArgsTest, DefaultsToLines) {
    Argv args{"twbuild", "build"};
    auto result = parse_build_args(args.argc(), args.argv(), 2, CommandKind::Build);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).emit, build::DirectiveFormat::Lines);
    EXPECT_FALSE(unwrap(result).always);
    EXPECT_EQ(unwrap(result).target, "exports");
}

TEST(BuildArgsTest, CMakeOutImpliesCMakeFormat) {
    Argv args{"twbuild", "build", "--cmake-out", "tw.cmake"};
    auto result = parse_build_args(args.argc(), args.argv(), 2, CommandKind::Build);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).emit, build::DirectiveFormat::CMake);
    EXPECT_EQ(unwrap(result).cmake_out, "tw.cmake");
}

TEST(BuildArgsTest, RejectsBadInput) {
    Argv unknown{"twbuild", "build", "--bogus"};
    EXPECT_TRUE(is_err(parse_build_args(unknown.argc(), unknown.argv(), 2, CommandKind::Build)));

    Argv missing{"twbuild", "build", "--css"};
    EXPECT_TRUE(is_err(parse_build_args(missing.argc(), missing.argv(), 2, CommandKind::Build)));

    Argv format{"twbuild", "build", "--emit", "yaml"};
    EXPECT_TRUE(is_err(parse_build_args(format.argc(), format.argv(), 2, CommandKind::Build)));
}

TEST(BuildArgsTest, TargetIsRenderOnly) {
    Argv build_args{"twbuild", "build", "--target", "jit"};
    auto rejected = parse_build_args(build_args.argc(), build_args.argv(), 2, CommandKind::Build);
    ASSERT_TRUE(is_err(rejected));
    EXPECT_NE(unwrap_err(rejected).find("--target"), std::string::npos);

    Argv equals_form{"twbuild", "build", "--target=jit"};
    EXPECT_TRUE(is_err(parse_build_args(equals_form.argc(), equals_form.argv(), 2, CommandKind::Build)));

    Argv render_args{"twbuild", "render", "--target", "jit", "--src-dir", "web"};
    auto accepted = parse_build_args(render_args.argc(), render_args.argv(), 2, CommandKind::Render);
    ASSERT_TRUE(is_ok(accepted)) << unwrap_err(accepted);
    EXPECT_EQ(unwrap(accepted).target, "jit");
    EXPECT_EQ(unwrap(accepted).src_dir, "web");
}

TEST(BuildArgsTest, BuildOnlyFlagsRejectedByRender) {
    Argv emit{"twbuild", "render", "--emit=cmake"};
    EXPECT_TRUE(is_err(parse_build_args(emit.argc(), emit.argv(), 2, CommandKind::Render)));

    Argv always{"twbuild", "render", "--always"};
    EXPECT_TRUE(is_err(parse_build_args(always.argc(), always.argv(), 2, CommandKind::Render)));
}

// ============================================================================
// Commands
// ============================================================================

class CliCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tmp.path();
        fs::create_directories(root / "src");
    }

    build::EnvironmentSnapshot env_for(const char* profile) const {
        return build::EnvironmentSnapshot({}, root)
            .with(build::ENV_OUT_DIR, (root / "out").string())
            .with(build::ENV_PROFILE, profile);
    }

    TempDir tmp;
    fs::path root;
    SpyToolRunner runner;
};

TEST_F(CliCommandTest, BuildPrintsDirectives) {
    BuildCommandOptions opts;
    std::ostringstream out;

    EXPECT_EQ(run_build_with(opts, env_for("debug"), runner, out), 0);
    EXPECT_NE(out.str().find("twbuild:rerun-if-env-changed=PROFILE\n"), std::string::npos);
    EXPECT_NE(out.str().find("twbuild:env=INCLUDE_TAILWIND_JIT_URL=https://cdn.tailwindcss.com\n"),
              std::string::npos);
    EXPECT_TRUE(runner.invocations.empty());
}

TEST_F(CliCommandTest, BuildFailureStillPrintsDirectives) {
    BuildCommandOptions opts;
    opts.css_path = "missing.css";
    std::ostringstream out;

    EXPECT_EQ(run_build_with(opts, env_for("release"), runner, out), 1);
    EXPECT_NE(out.str().find("twbuild:rerun-if-changed="), std::string::npos);
    EXPECT_TRUE(runner.invocations.empty());
}

TEST_F(CliCommandTest, BuildWritesCMakeFile) {
    BuildCommandOptions opts;
    opts.emit = build::DirectiveFormat::CMake;
    opts.cmake_out = (root / "tw.cmake").string();
    std::ostringstream out;

    EXPECT_EQ(run_build_with(opts, env_for("debug"), runner, out), 0);
    EXPECT_TRUE(out.str().empty());

    std::string script = read_file(root / "tw.cmake");
    EXPECT_NE(script.find("set(INCLUDE_TAILWIND_JIT_URL \"https://cdn.tailwindcss.com\")"),
              std::string::npos);
}

TEST_F(CliCommandTest, InvalidConfigFileFails) {
    write_file(root / "tw.json", "{ not json");
    BuildCommandOptions opts;
    opts.config_file = (root / "tw.json").string();
    std::ostringstream out;

    EXPECT_EQ(run_build_with(opts, env_for("debug"), runner, out), 1);
    EXPECT_FALSE(fs::exists(root / "out" / "jit_config.js"));
}

TEST_F(CliCommandTest, RenderPrintsWrappedConfig) {
    write_file(root / "tw.json", R"({"content": ["{src_dir}/**/*.html"]})");
    BuildCommandOptions opts;
    opts.config_file = (root / "tw.json").string();
    opts.target = "jit";
    std::ostringstream out;

    EXPECT_EQ(run_render_with(opts, env_for("debug"), out), 0);

    std::string expected = "tailwind.config = {\n  \"content\": [\n    \"" +
                           fs::canonical(root / "src").string() + "/**/*.html\"\n  ]\n}\n";
    EXPECT_EQ(out.str(), expected);
    EXPECT_FALSE(fs::exists(root / "out"));
}

TEST_F(CliCommandTest, RenderRejectsUnknownTarget) {
    BuildCommandOptions opts;
    opts.target = "esm";
    std::ostringstream out;
    EXPECT_EQ(run_render_with(opts, env_for("debug"), out), 1);
    EXPECT_TRUE(out.str().empty());
}

//! # Orchestrator Tests
//!
//! Both pipelines run against a scratch project with a spy tool runner:
//!
//! ```text
//! <tmp>/
//!   ├─ src/       # project sources, substituted for {src_dir}
//!   └─ out/       # OUT_DIR
//! ```

#include "build/artifacts.hpp"
#include "build/orchestrator.hpp"
#include "json/json_parser.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <set>

using namespace twbuild;
using namespace twbuild::build;
using twbuild::test::read_file;
using twbuild::test::SpyToolRunner;
using twbuild::test::TempDir;
using twbuild::test::write_file;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tmp.path();
        out = root / "out";
        fs::create_directories(root / "src");
        src = fs::canonical(root / "src");
    }

    EnvironmentSnapshot env_for(const char* profile) const {
        EnvironmentSnapshot env = EnvironmentSnapshot({}, root).with(ENV_OUT_DIR, out.string());
        return profile ? env.with(ENV_PROFILE, profile) : env;
    }

    Result<BuildOutcome, BuildError> run(const BuildConfig& config,
                                         const EnvironmentSnapshot& env) {
        Orchestrator orchestrator(config, env, runner, directives);
        return orchestrator.run();
    }

    std::set<std::string> out_entries() const {
        std::set<std::string> names;
        for (const auto& entry : fs::directory_iterator(out)) {
            names.insert(entry.path().filename().string());
        }
        return names;
    }

    /// Parses a written config script after stripping its assignment prefix.
    static json::JsonValue parse_script(const fs::path& file, std::string_view prefix) {
        std::string text = read_file(file);
        if (text.rfind(prefix, 0) != 0) {
            ADD_FAILURE() << file << " does not start with '" << prefix << "'";
            return json::JsonValue();
        }
        auto parsed = json::parse_json(std::string_view(text).substr(prefix.size()));
        if (is_err(parsed)) {
            ADD_FAILURE() << unwrap_err(parsed).to_string();
            return json::JsonValue();
        }
        return std::move(unwrap(parsed));
    }

    TempDir tmp;
    fs::path root;
    fs::path out;
    fs::path src;
    SpyToolRunner runner;
    DirectiveSink directives;
};

// ============================================================================
// InstallCompile
// ============================================================================

TEST_F(OrchestratorTest, ReleaseInstallsAndCompiles) {
    auto env = env_for("release");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    const auto& outcome = unwrap(result);
    EXPECT_EQ(outcome.pipeline, Pipeline::InstallCompile);
    EXPECT_EQ(outcome.profile, BuildProfile::Release);
    EXPECT_TRUE(outcome.manifest_created);
    EXPECT_TRUE(outcome.toolchain_installed);
    EXPECT_EQ(outcome.stylesheet, StylesheetOrigin::Builtin);
    EXPECT_EQ(outcome.src_dir, src);

    ASSERT_EQ(runner.invocations.size(), 2u);
    EXPECT_EQ(runner.invocations[0].program, "npm");
    EXPECT_EQ(runner.invocations[0].args, std::vector<std::string>{"install"});
    EXPECT_EQ(runner.invocations[0].working_dir, out);

    EXPECT_EQ(runner.invocations[1].program, "npx");
    EXPECT_EQ(runner.invocations[1].args,
              (std::vector<std::string>{"tailwindcss", "-i", (out / "style.in.css").string(), "-o",
                                        (out / "style.css").string(), "--minify"}));
    EXPECT_EQ(runner.invocations[1].working_dir, out);

    EXPECT_EQ(read_file(out / "package.json"), DEFAULT_PACKAGE_JSON);
    EXPECT_EQ(read_file(out / "style.in.css"), DEFAULT_STYLE_CSS);

    auto config = parse_script(out / "tailwind.config.js", "module.exports = ");
    ASSERT_TRUE(config.contains("content"));
    EXPECT_EQ((*config.get("content"))[0].as_string(), src.string() + "/**/*.{html,js,rs}");

    EXPECT_EQ(directives.env(ENV_TAILWIND_PATH), (out / "style.css").string());
    EXPECT_FALSE(directives.env(ENV_JIT_CONFIG_PATH).has_value());
    EXPECT_TRUE(directives.of_kind(DirectiveKind::Warning).empty());
}

TEST_F(OrchestratorTest, AlwaysForcesInstallCompileInDebug) {
    auto env = env_for("debug");
    auto result = run(BuildConfig().always(), env);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result).pipeline, Pipeline::InstallCompile);
    EXPECT_EQ(runner.invocations.size(), 2u);
}

TEST_F(OrchestratorTest, AlwaysWithReleaseStillInstallCompile) {
    auto env = env_for("release");
    auto result = run(BuildConfig().always(), env);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).pipeline, Pipeline::InstallCompile);
}

TEST_F(OrchestratorTest, AlwaysWritesCustomConfig) {
    auto doc = json::json_object();
    auto content = json::json_array();
    content.push(json::json_string("{src_dir}/**/*.html"));
    doc.set("content", std::move(content));

    auto env = env_for("debug");
    auto result = run(BuildConfig().always().with_tw_config(doc), env);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    auto config = parse_script(out / "tailwind.config.js", "module.exports = ");
    ASSERT_EQ(config.size(), 1u);
    ASSERT_EQ(config.get("content")->size(), 1u);
    EXPECT_EQ((*config.get("content"))[0].as_string(), src.string() + "/**/*.html");
}

TEST_F(OrchestratorTest, ExistingManifestIsNotOverwritten) {
    write_file(out / "package.json", "{\"name\": \"mine\"}");

    auto env = env_for("release");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).manifest_created);
    EXPECT_EQ(read_file(out / "package.json"), "{\"name\": \"mine\"}");
}

TEST_F(OrchestratorTest, ExistingNodeModulesSkipsInstall) {
    fs::create_directories(out / "node_modules");

    auto env = env_for("release");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).toolchain_installed);

    ASSERT_EQ(runner.invocations.size(), 1u);
    EXPECT_EQ(runner.invocations[0].program, "npx");
}

TEST_F(OrchestratorTest, SecondRunOnlyRecompiles) {
    runner.on_run = [](const ToolInvocation& invocation) {
        if (invocation.program == "npm") {
            fs::create_directories(invocation.working_dir / "node_modules");
        }
    };

    auto env = env_for("release");
    ASSERT_TRUE(is_ok(run(BuildConfig(), env)));
    runner.invocations.clear();

    auto second = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(second));
    EXPECT_FALSE(unwrap(second).manifest_created);
    EXPECT_FALSE(unwrap(second).toolchain_installed);
    ASSERT_EQ(runner.invocations.size(), 1u);
    EXPECT_EQ(runner.invocations[0].program, "npx");
}

TEST_F(OrchestratorTest, RootStylesheetIsUsed) {
    write_file(root / "style.css", "@tailwind base;\nbody { margin: 0 }\n");

    auto env = env_for("release");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).stylesheet, StylesheetOrigin::Root);
    EXPECT_EQ(read_file(out / "style.in.css"), "@tailwind base;\nbody { margin: 0 }\n");
}

TEST_F(OrchestratorTest, CustomStylesheetWinsOverRoot) {
    write_file(root / "style.css", "root");
    write_file(root / "assets" / "app.css", "custom");

    auto env = env_for("release");
    auto result = run(BuildConfig().with_path(fs::path("assets/app.css")), env);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result).stylesheet, StylesheetOrigin::Custom);
    EXPECT_EQ(read_file(out / "style.in.css"), "custom");

    auto reruns = directives.of_kind(DirectiveKind::RerunIfChanged);
    ASSERT_EQ(reruns.size(), 1u);
    EXPECT_EQ(reruns[0].key, (root / "assets" / "app.css").lexically_normal().string());
}

TEST_F(OrchestratorTest, MissingCustomStylesheetFailsBeforeAnyTool) {
    auto env = env_for("release");
    auto result = run(BuildConfig().with_path(root / "missing.css"), env);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::MissingStylesheet);
    EXPECT_TRUE(runner.invocations.empty());
    EXPECT_FALSE(fs::exists(out / "package.json"));
    EXPECT_FALSE(directives.env(ENV_TAILWIND_PATH).has_value());
}

TEST_F(OrchestratorTest, InstallFailureIsToolInstall) {
    runner.exit_codes["npm"] = 1;

    auto env = env_for("release");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ToolInstall);
    ASSERT_EQ(runner.invocations.size(), 1u);
    EXPECT_FALSE(fs::exists(out / "tailwind.config.js"));
}

TEST_F(OrchestratorTest, CompileFailureIsToolCompile) {
    runner.exit_codes["npx"] = 2;

    auto env = env_for("release");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::ToolCompile);
    EXPECT_FALSE(directives.env(ENV_TAILWIND_PATH).has_value());
}

// ============================================================================
// JitSetup
// ============================================================================

TEST_F(OrchestratorTest, DebugWritesOnlyJitConfig) {
    auto env = env_for("debug");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    EXPECT_EQ(unwrap(result).pipeline, Pipeline::JitSetup);
    EXPECT_FALSE(unwrap(result).stylesheet.has_value());
    EXPECT_TRUE(runner.invocations.empty());
    EXPECT_EQ(out_entries(), std::set<std::string>{"jit_config.js"});

    auto config = parse_script(out / "jit_config.js", "tailwind.config = ");
    EXPECT_EQ((*config.get("content"))[0].as_string(), src.string() + "/**/*.{html,js,rs}");

    EXPECT_EQ(directives.env(ENV_JIT_CONFIG_PATH), (out / "jit_config.js").string());
    EXPECT_EQ(directives.env(ENV_JIT_URL), "https://cdn.tailwindcss.com");
    EXPECT_FALSE(directives.env(ENV_TAILWIND_PATH).has_value());
}

TEST_F(OrchestratorTest, MissingProfileWarnsAndUsesJit) {
    auto env = env_for(nullptr);
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).profile, BuildProfile::Unknown);
    EXPECT_EQ(unwrap(result).pipeline, Pipeline::JitSetup);

    auto warnings = directives.of_kind(DirectiveKind::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].value, "'PROFILE' was not defined, defaulting to debug");
}

TEST_F(OrchestratorTest, JitUsesCustomCdnAndConfig) {
    auto doc = json::json_object();
    auto content = json::json_array();
    content.push(json::json_string("{src_dir}/**/*.html"));
    doc.set("content", std::move(content));

    auto env = env_for("debug");
    auto result =
        run(BuildConfig().with_cdn_src("https://example.com/tw.js").with_tw_config(doc), env);
    ASSERT_TRUE(is_ok(result));

    EXPECT_EQ(directives.env(ENV_JIT_URL), "https://example.com/tw.js");
    auto config = parse_script(out / "jit_config.js", "tailwind.config = ");
    ASSERT_EQ(config.get("content")->size(), 1u);
    EXPECT_EQ((*config.get("content"))[0].as_string(), src.string() + "/**/*.html");
    EXPECT_FALSE(config.contains("theme"));
}

TEST_F(OrchestratorTest, JitIgnoresMissingCustomStylesheet) {
    auto env = env_for("debug");
    auto result = run(BuildConfig().with_path(root / "missing.css"), env);
    EXPECT_TRUE(is_ok(result));
}

// ============================================================================
// Input Resolution
// ============================================================================

TEST_F(OrchestratorTest, MissingOutDirIsMissingEnv) {
    auto env = env_for("release").without(ENV_OUT_DIR);
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::MissingEnv);
    EXPECT_TRUE(runner.invocations.empty());
}

TEST_F(OrchestratorTest, MissingSourceDirIsIo) {
    fs::remove_all(root / "src");

    auto env = env_for("debug");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::Io);
}

TEST_F(OrchestratorTest, RelativeOutDirResolvesAgainstRoot) {
    auto env = env_for("debug").with(ENV_OUT_DIR, "build/tw");
    auto result = run(BuildConfig(), env);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).out_dir, (root / "build" / "tw").lexically_normal());
    EXPECT_TRUE(fs::exists(root / "build" / "tw" / "jit_config.js"));
}

TEST_F(OrchestratorTest, SourceDirOverride) {
    fs::create_directories(root / "web");

    auto env = env_for("debug");
    Orchestrator orchestrator(BuildConfig(), env, runner, directives);
    orchestrator.set_source_dir("web");

    auto result = orchestrator.run();
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).src_dir, fs::canonical(root / "web"));
}

TEST_F(OrchestratorTest, BuildTailwindUsesDefaults) {
    auto env = env_for("debug");
    auto result = build_tailwind(env, runner, directives);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(directives.env(ENV_JIT_URL), DEFAULT_CDN_SRC);
}

TEST_F(OrchestratorTest, KeepsItsOwnEnvironmentCopy) {
    // The snapshot passed in is a temporary gone before run()
    Orchestrator orchestrator(BuildConfig(), env_for("debug").with(ENV_PROFILE, "release"), runner,
                              directives);

    auto result = orchestrator.run();
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result).pipeline, Pipeline::InstallCompile);
    EXPECT_EQ(unwrap(result).out_dir, out.lexically_normal());
}

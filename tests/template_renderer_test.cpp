//! # Template Renderer Tests
//!
//! Substitution of `{src_dir}`, escaping of the inserted path and the two
//! script wrappers.

#include "build/build_config.hpp"
#include "build/template_renderer.hpp"
#include "json/json_parser.hpp"

#include <gtest/gtest.h>

using namespace twbuild;
using namespace twbuild::build;

namespace {

json::JsonValue parse_or_empty(std::string_view text) {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        ADD_FAILURE() << unwrap_err(parsed).to_string();
        return json::JsonValue();
    }
    return std::move(unwrap(parsed));
}

} // namespace

// ============================================================================
// render_config
// ============================================================================

TEST(RenderConfigTest, DefaultDocument) {
    auto result = render_config(default_tw_config(), "/proj/src");
    ASSERT_TRUE(is_ok(result));

    const auto& rendered = unwrap(result);
    EXPECT_EQ(rendered.substitutions, 1u);
    EXPECT_EQ(rendered.text, "{\n"
                             "  \"content\": [\n"
                             "    \"/proj/src/**/*.{html,js,rs}\"\n"
                             "  ],\n"
                             "  \"plugins\": [],\n"
                             "  \"theme\": {\n"
                             "    \"extend\": {}\n"
                             "  }\n"
                             "}");
}

TEST(RenderConfigTest, CustomContentGlob) {
    auto doc = parse_or_empty(R"({"content": ["{src_dir}/**/*.html"]})");
    auto result = render_config(doc, "/proj/src");
    ASSERT_TRUE(is_ok(result));

    auto back = parse_or_empty(unwrap(result).text);
    ASSERT_TRUE(back.contains("content"));
    ASSERT_EQ(back.get("content")->size(), 1u);
    EXPECT_EQ((*back.get("content"))[0].as_string(), "/proj/src/**/*.html");
}

TEST(RenderConfigTest, EveryTokenIsReplaced) {
    auto doc = parse_or_empty(
        R"({"content": ["{src_dir}/a/*.html", "{src_dir}/b/*.js"], "note": "{src_dir}{src_dir}"})");
    auto result = render_config(doc, "/p");
    ASSERT_TRUE(is_ok(result));

    EXPECT_EQ(unwrap(result).substitutions, 4u);
    EXPECT_EQ(count_placeholders(unwrap(result).text), 0u);

    auto back = parse_or_empty(unwrap(result).text);
    EXPECT_EQ(back.get("note")->as_string(), "/p/p");
}

TEST(RenderConfigTest, DocumentWithoutTokensIsUnchanged) {
    auto doc = parse_or_empty(R"({"content": ["./templates/**/*.html"]})");
    auto result = render_config(doc, "/proj/src");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).substitutions, 0u);
    EXPECT_EQ(unwrap(result).text, doc.to_string_pretty(2));
}

#ifndef _WIN32
TEST(RenderConfigTest, PathWithQuotesAndBackslashesStaysValid) {
    const std::string dir = "/tmp/we\"ird\\dir";
    auto result = render_config(default_tw_config(), fs::path(dir));
    ASSERT_TRUE(is_ok(result));

    auto back = parse_or_empty(unwrap(result).text);
    ASSERT_TRUE(back.contains("content"));
    EXPECT_EQ((*back.get("content"))[0].as_string(), dir + "/**/*.{html,js,rs}");
}

TEST(RenderConfigTest, NonUtf8PathIsRejected) {
    auto result = render_config(default_tw_config(), fs::path(std::string("/tmp/\xff\xfe")));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildErrorKind::InvalidSrcPath);
}
#endif

TEST(RenderConfigTest, NonAsciiPathIsKept) {
    auto result = render_config(default_tw_config(), fs::path(u8"/proj/caf\u00e9/src"));
    ASSERT_TRUE(is_ok(result));

    auto back = parse_or_empty(unwrap(result).text);
    EXPECT_EQ((*back.get("content"))[0].as_string(), "/proj/caf\xC3\xA9/src/**/*.{html,js,rs}");
}

// ============================================================================
// Helpers
// ============================================================================

TEST(TemplateHelpersTest, CountPlaceholders) {
    EXPECT_EQ(count_placeholders(""), 0u);
    EXPECT_EQ(count_placeholders("{src_dir}"), 1u);
    EXPECT_EQ(count_placeholders("{src_dir}/x/{src_dir}"), 2u);
    EXPECT_EQ(count_placeholders("{src_di}"), 0u);
}

TEST(TemplateHelpersTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));     // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80")); // surrogate
}

TEST(TemplateHelpersTest, Wrappers) {
    EXPECT_EQ(wrap_config("{}", ConfigTarget::ModuleExports), "module.exports = {}\n");
    EXPECT_EQ(wrap_config("{}", ConfigTarget::JitGlobal), "tailwind.config = {}\n");
}

TEST(TemplateHelpersTest, ParsesTargetNames) {
    EXPECT_EQ(parse_config_target("exports"), ConfigTarget::ModuleExports);
    EXPECT_EQ(parse_config_target("jit"), ConfigTarget::JitGlobal);
    EXPECT_FALSE(parse_config_target("esm").has_value());
}

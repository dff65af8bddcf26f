#include "build/build_config.hpp"

#include "build/file_ops.hpp"
#include "json/json_parser.hpp"

namespace twbuild::build {

json::JsonValue default_tw_config() {
    auto content = json::json_array();
    content.push(json::JsonValue("{src_dir}/**/*.{html,js,rs}"));

    auto theme = json::json_object();
    theme.set("extend", json::json_object());

    auto config = json::json_object();
    config.set("content", std::move(content));
    config.set("theme", std::move(theme));
    config.set("plugins", json::json_array());
    return config;
}

BuildConfig::BuildConfig() : tw_config_(default_tw_config()), cdn_src_(DEFAULT_CDN_SRC) {}

BuildConfig::BuildConfig(const BuildConfig& other)
    : css_path_(other.css_path_), always_(other.always_), tw_config_(other.tw_config_.clone()),
      cdn_src_(other.cdn_src_) {}

BuildConfig& BuildConfig::operator=(const BuildConfig& other) {
    if (this != &other) {
        css_path_ = other.css_path_;
        always_ = other.always_;
        tw_config_ = other.tw_config_.clone();
        cdn_src_ = other.cdn_src_;
    }
    return *this;
}

BuildConfig BuildConfig::with_path(std::optional<fs::path> path) const {
    BuildConfig copy = *this;
    copy.css_path_ = std::move(path);
    return copy;
}

BuildConfig BuildConfig::with_cdn_src(std::string src) const {
    BuildConfig copy = *this;
    copy.cdn_src_ = std::move(src);
    return copy;
}

BuildConfig BuildConfig::with_tw_config(const json::JsonValue& config) const {
    BuildConfig copy = *this;
    copy.tw_config_ = config.clone();
    return copy;
}

BuildConfig BuildConfig::always() const {
    BuildConfig copy = *this;
    copy.always_ = true;
    return copy;
}

Result<json::JsonValue, BuildError> load_tw_config(const fs::path& path) {
    auto text = read_text_file(path);
    if (is_err(text)) {
        return unwrap_err(text);
    }

    auto parsed = json::parse_json(unwrap(text));
    if (is_err(parsed)) {
        return BuildError::make(BuildErrorKind::InvalidConfig, unwrap_err(parsed).to_string(),
                                path);
    }
    return std::move(unwrap(parsed));
}

} // namespace twbuild::build

#include "build/template_renderer.hpp"

#include "build/build_config.hpp"
#include "log/log.hpp"

#include <cstdint>

namespace twbuild::build {

namespace {

/// The directory as UTF-8 bytes, with '/' separators on Windows so glob
/// patterns stay valid.
std::string path_bytes(const fs::path& p) {
#ifdef _WIN32
    auto u8 = p.generic_u8string();
    return std::string(u8.begin(), u8.end());
#else
    return p.native();
#endif
}

} // namespace

std::optional<ConfigTarget> parse_config_target(std::string_view name) {
    if (name == "exports") {
        return ConfigTarget::ModuleExports;
    }
    if (name == "jit") {
        return ConfigTarget::JitGlobal;
    }
    return std::nullopt;
}

size_t count_placeholders(std::string_view text) {
    const std::string_view token = SRC_DIR_TOKEN;
    size_t count = 0;
    for (size_t pos = text.find(token); pos != std::string_view::npos;
         pos = text.find(token, pos + token.size())) {
        ++count;
    }
    return count;
}

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        auto c = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        uint32_t cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > bytes.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

Result<RenderedConfig, BuildError> render_config(const json::JsonValue& document,
                                                 const fs::path& src_dir) {
    std::string dir = path_bytes(src_dir);
    if (!is_valid_utf8(dir)) {
        return BuildError::make(BuildErrorKind::InvalidSrcPath,
                                "the source dir contained invalid unicode", src_dir);
    }

    const std::string_view token = SRC_DIR_TOKEN;
    const std::string replacement = json::escape_json_string(dir);
    const std::string serialized = document.to_string_pretty(2);

    RenderedConfig rendered;
    rendered.text.reserve(serialized.size());

    size_t last = 0;
    for (size_t pos = serialized.find(token); pos != std::string::npos;
         pos = serialized.find(token, last)) {
        rendered.text.append(serialized, last, pos - last);
        rendered.text += replacement;
        last = pos + token.size();
        ++rendered.substitutions;
    }
    rendered.text.append(serialized, last, std::string::npos);

    TWBUILD_LOG_DEBUG("render", "substituted " << rendered.substitutions << " "
                                               << SRC_DIR_TOKEN << " token(s) with " << dir);
    return rendered;
}

std::string wrap_config(std::string_view config_text, ConfigTarget target) {
    std::string out = target == ConfigTarget::ModuleExports ? "module.exports = "
                                                            : "tailwind.config = ";
    out += config_text;
    out += '\n';
    return out;
}

} // namespace twbuild::build

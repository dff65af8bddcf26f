//! # Directive Rendering
//!
//! `lines` output is line oriented, so embedded newlines in a payload are
//! folded to spaces. `cmake` output quotes every value as a CMake bracket-free
//! quoted argument, escaping `\`, `"` and `$`.

#include "build/directives.hpp"

#include <sstream>

namespace twbuild::build {

namespace {

std::string single_line(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

std::string cmake_quote(std::string_view s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '\\' || c == '"' || c == '$') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::optional<DirectiveFormat> parse_directive_format(std::string_view name) {
    if (name == "lines") {
        return DirectiveFormat::Lines;
    }
    if (name == "cmake") {
        return DirectiveFormat::CMake;
    }
    return std::nullopt;
}

void DirectiveSink::warning(std::string message) {
    directives_.push_back({DirectiveKind::Warning, {}, std::move(message)});
}

void DirectiveSink::rerun_if_env_changed(std::string name) {
    directives_.push_back({DirectiveKind::RerunIfEnvChanged, std::move(name), {}});
}

void DirectiveSink::rerun_if_changed(std::string path) {
    directives_.push_back({DirectiveKind::RerunIfChanged, std::move(path), {}});
}

void DirectiveSink::set_env(std::string name, std::string value) {
    directives_.push_back({DirectiveKind::SetEnv, std::move(name), std::move(value)});
}

std::vector<Directive> DirectiveSink::of_kind(DirectiveKind kind) const {
    std::vector<Directive> result;
    for (const auto& d : directives_) {
        if (d.kind == kind) {
            result.push_back(d);
        }
    }
    return result;
}

std::optional<std::string> DirectiveSink::env(std::string_view name) const {
    std::optional<std::string> value;
    for (const auto& d : directives_) {
        if (d.kind == DirectiveKind::SetEnv && d.key == name) {
            value = d.value;
        }
    }
    return value;
}

std::string DirectiveSink::render(DirectiveFormat format) const {
    std::ostringstream out;

    if (format == DirectiveFormat::CMake) {
        out << "# Generated by twbuild. Do not edit.\n";
    }

    for (const auto& d : directives_) {
        if (format == DirectiveFormat::Lines) {
            switch (d.kind) {
            case DirectiveKind::Warning:
                out << "twbuild:warning=" << single_line(d.value) << "\n";
                break;
            case DirectiveKind::RerunIfEnvChanged:
                out << "twbuild:rerun-if-env-changed=" << d.key << "\n";
                break;
            case DirectiveKind::RerunIfChanged:
                out << "twbuild:rerun-if-changed=" << single_line(d.key) << "\n";
                break;
            case DirectiveKind::SetEnv:
                out << "twbuild:env=" << d.key << "=" << single_line(d.value) << "\n";
                break;
            }
            continue;
        }

        switch (d.kind) {
        case DirectiveKind::Warning:
            out << "message(WARNING " << cmake_quote(d.value) << ")\n";
            break;
        case DirectiveKind::RerunIfEnvChanged:
            // CMake has no per-variable env tracking; the consumer re-runs twbuild every build
            out << "# rerun-if-env-changed: " << d.key << "\n";
            break;
        case DirectiveKind::RerunIfChanged:
            out << "set_property(DIRECTORY APPEND PROPERTY CMAKE_CONFIGURE_DEPENDS "
                << cmake_quote(d.key) << ")\n";
            break;
        case DirectiveKind::SetEnv:
            out << "set(" << d.key << " " << cmake_quote(d.value) << ")\n";
            break;
        }
    }

    return out.str();
}

} // namespace twbuild::build

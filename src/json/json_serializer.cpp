//! # JSON Serializer
//!
//! Converts a `JsonValue` to compact or pretty-printed text.
//!
//! Pretty output uses `"key": value` with one member per line, and prints
//! empty containers as `{}` and `[]`:
//!
//! ```text
//! {
//!   "content": [
//!     "{src_dir}/**/*.{html,js,rs}"
//!   ],
//!   "plugins": [],
//!   "theme": {
//!     "extend": {}
//!   }
//! }
//! ```
//!
//! Braces inside string values are never escaped, so a `{src_dir}` token in
//! the document survives serialization byte for byte.

#include "json/json_value.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace twbuild::json {

auto escape_json_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

namespace {

auto format_number(const JsonNumber& num) -> std::string {
    switch (num.kind) {
    case JsonNumber::Kind::Int64:
        return std::to_string(num.i64);
    case JsonNumber::Kind::Uint64:
        return std::to_string(num.u64);
    case JsonNumber::Kind::Double: {
        // JSON has no NaN or Infinity
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            return "null";
        }

        // Shortest text that parses back to the same double
        char buf[32];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), num.f64);
        if (ec != std::errc()) {
            return "null";
        }
        std::string result(buf, end);

        if (result.find_first_of(".eE") == std::string::npos) {
            result += ".0";
        }
        return result;
    }
    }
    return "0";
}

void append_string(std::string_view s, std::string& out) {
    out += '"';
    out += escape_json_string(s);
    out += '"';
}

/// Writes scalars; returns false for arrays and objects.
auto append_scalar(const JsonValue& value, std::string& out) -> bool {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        out += format_number(value.as_number());
    } else if (value.is_string()) {
        append_string(value.as_string(), out);
    } else {
        return false;
    }
    return true;
}

void serialize_compact(const JsonValue& value, std::string& out) {
    if (append_scalar(value, out)) {
        return;
    }

    if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& elem : value.as_array()) {
            if (!first) {
                out += ',';
            }
            first = false;
            serialize_compact(elem, out);
        }
        out += ']';
        return;
    }

    out += '{';
    bool first = true;
    for (const auto& [key, val] : value.as_object()) {
        if (!first) {
            out += ',';
        }
        first = false;
        append_string(key, out);
        out += ':';
        serialize_compact(val, out);
    }
    out += '}';
}

void serialize_pretty(const JsonValue& value, std::string& out, int indent, int depth) {
    if (append_scalar(value, out)) {
        return;
    }

    std::string indent_str(static_cast<size_t>(depth * indent), ' ');
    std::string next_indent(static_cast<size_t>((depth + 1) * indent), ' ');

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }

        out += "[\n";
        for (size_t i = 0; i < arr.size(); ++i) {
            out += next_indent;
            serialize_pretty(arr[i], out, indent, depth + 1);
            if (i + 1 < arr.size()) {
                out += ',';
            }
            out += '\n';
        }
        out += indent_str;
        out += ']';
        return;
    }

    const auto& obj = value.as_object();
    if (obj.empty()) {
        out += "{}";
        return;
    }

    out += "{\n";
    size_t i = 0;
    for (const auto& [key, val] : obj) {
        out += next_indent;
        append_string(key, out);
        out += ": ";
        serialize_pretty(val, out, indent, depth + 1);
        if (++i < obj.size()) {
            out += ',';
        }
        out += '\n';
    }
    out += indent_str;
    out += '}';
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize_compact(*this, out);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize_pretty(*this, out, indent, 0);
    return out;
}

} // namespace twbuild::json

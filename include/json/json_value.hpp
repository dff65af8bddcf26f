//! # JSON Value Types
//!
//! `JsonValue` holds the Tailwind configuration document. It is a value type
//! over a variant of the six JSON kinds, with arrays and objects boxed so the
//! type can be recursive.
//!
//! ## Key Order
//!
//! `JsonObject` is a `std::map`, so objects always serialize with their keys
//! in sorted order. The rendered `tailwind.config.js` is therefore stable
//! across runs regardless of how the document was assembled.
//!
//! ## Copying
//!
//! Boxed children make `JsonValue` move-only. Use `clone()` for a deep copy.
//!
//! ## Example
//!
//! ```cpp
//! auto content = json_array();
//! content.push(JsonValue("{src_dir}/**/*.html"));
//!
//! auto config = json_object();
//! config.set("content", std::move(content));
//! config.set("plugins", json_array());
//! std::cout << config.to_string_pretty() << std::endl;
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace twbuild::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// JSON number preserving integer precision.
///
/// Numbers written without a fraction or exponent are kept as `Int64` (or
/// `Uint64` when too large), so `"minWidth": 640` round-trips as `640` and
/// not `640.0`.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Uint64, Double };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    /// Returns the value as `int64_t` when that conversion is lossless.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Returns the value as `double`. May lose precision above 2^53.
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Numbers of different kinds compare as doubles.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }

    [[nodiscard]] auto operator!=(const JsonNumber& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// Any JSON value.
///
/// | JSON Type | Storage | Query | Accessor |
/// |-----------|---------|-------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | number | `JsonNumber` | `is_number()` | `as_number()`, `as_i64()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Box<JsonArray>` | `is_array()` | `as_array()`, `operator[]` |
/// | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}
    explicit JsonValue(JsonNumber value) : data(value) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================

    /// Throws `std::bad_variant_access` if this is not a boolean.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Returns the integer value, or 0 when this is not a lossless integer.
    [[nodiscard]] auto as_i64() const -> int64_t {
        return as_number().try_as_i64().value_or(0);
    }

    // ========================================================================
    // Object / Array Access
    // ========================================================================

    /// Returns the member named `key`, or `nullptr` when this is not an
    /// object or has no such member.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array()[index];
    }

    /// Element count for arrays, member count for objects, 0 otherwise.
    [[nodiscard]] auto size() const -> size_t {
        if (is_array()) {
            return as_array().size();
        }
        if (is_object()) {
            return as_object().size();
        }
        return 0;
    }

    /// Appends to an array value.
    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    /// Inserts or replaces an object member.
    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact JSON text with no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Pretty-printed JSON text, `indent` spaces per nesting level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    // ========================================================================
    // Copy and Compare
    // ========================================================================

    /// Deep copy.
    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

/// Escapes `s` for use inside a JSON string literal (without the quotes).
[[nodiscard]] auto escape_json_string(std::string_view s) -> std::string;

} // namespace twbuild::json

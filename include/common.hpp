//! # Common Definitions
//!
//! Shared by every twbuild component:
//!
//! - `VERSION` for `twbuild --version`
//! - `Result<T, E>`: every fallible step returns one instead of throwing
//! - `Box<T>` for the owned children of recursive types such as `JsonValue`

#ifndef TWBUILD_COMMON_HPP
#define TWBUILD_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace twbuild {

constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto rendered = render_config(doc, src_dir);
/// if (is_err(rendered)) {
///     return unwrap_err(rendered);
/// }
/// write_text_file(target, unwrap(rendered).text);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace twbuild

#endif // TWBUILD_COMMON_HPP

//! # JSON Error Types
//!
//! Parse errors carry the line and column where the input went wrong, so a
//! malformed `--config` file can be reported precisely.
//!
//! ```cpp
//! auto error = JsonError::make("Unexpected token", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // line 5, column 12: Unexpected token
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace twbuild::json {

/// An error encountered while parsing JSON input.
struct JsonError {
    /// Human-readable error description.
    std::string message;

    /// Line number (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset into the input (0 if unknown).
    size_t offset = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"` when the location is
    /// known, or just the message otherwise.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace twbuild::json

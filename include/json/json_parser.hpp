//! # JSON Parser
//!
//! Lexer and recursive descent parser producing `JsonValue` trees. Used to
//! load Tailwind config documents passed with `--config`, and by the tests
//! to read back the generated `tailwind.config.js` body.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"content": ["{src_dir}/**/*.html"]})");
//! if (is_ok(result)) {
//!     auto& doc = unwrap(result);
//!     std::cout << doc.get("content")->size() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>
#include <vector>

namespace twbuild::json {

// ============================================================================
// Tokens
// ============================================================================

enum class JsonTokenKind : uint8_t {
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,
    String,
    IntNumber,
    FloatNumber,
    True,
    False,
    Null,
    Eof,
    Error
};

/// A token with its location. `string_value` holds the unescaped content of
/// `String` tokens; `number_value` holds the parsed value of number tokens.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    std::string_view lexeme;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;
    std::string string_value;
    JsonNumber number_value;
};

// ============================================================================
// Lexer
// ============================================================================

class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token, `Eof` at end of input, `Error` on bad input.
    auto next_token() -> JsonToken;

    [[nodiscard]] auto errors() const -> const std::vector<JsonError>& {
        return errors_;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::vector<JsonError> errors_;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();

    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                    size_t start_col) -> JsonToken;
    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;

    void add_error(const std::string& msg, size_t line, size_t col);
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent parser with a nesting limit.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses the whole input. Trailing content after the value is an error.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    static constexpr size_t MAX_DEPTH = 256;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;
    auto match(JsonTokenKind kind) -> bool;
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace twbuild::json

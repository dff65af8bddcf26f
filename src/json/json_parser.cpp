//! # JSON Parser Implementation
//!
//! RFC 8259 lexing and parsing. Numbers without a fraction or exponent are
//! stored as integers; `\uXXXX` escapes are decoded to UTF-8.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace twbuild::json {

// ============================================================================
// JsonLexer
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                           size_t start_col) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(start_pos, pos_ - start_pos);
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

void JsonLexer::add_error(const std::string& msg, size_t line, size_t col) {
    errors_.push_back(JsonError::make(msg, line, col, pos_));
}

namespace {

void append_utf8(std::string& out, unsigned int codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

} // namespace

auto JsonLexer::scan_string() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = peek();

        if (c == '"') {
            advance();
            JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.string_value = std::move(value);
            return tok;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            add_error("Control character in string", line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }

        if (c != '\\') {
            value += advance();
            continue;
        }

        advance(); // backslash
        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            if (pos_ + 4 > input_.size()) {
                add_error("Incomplete unicode escape sequence", line_, column_);
                return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
            }
            std::string_view hex = input_.substr(pos_, 4);
            unsigned int codepoint = 0;
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, codepoint, 16);
            if (ec != std::errc{} || ptr != hex.data() + 4) {
                add_error("Invalid unicode escape sequence", line_, column_);
                return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
            }
            pos_ += 4;
            column_ += 4;
            append_utf8(value, codepoint);
            break;
        }
        default:
            add_error("Invalid escape sequence: \\" + std::string(1, escaped), line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
    }

    add_error("Unterminated string", start_line, start_col);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;
    bool is_float = false;

    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        add_error("Invalid number", start_line, start_col);
        return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            add_error("Expected digit after decimal point", line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            add_error("Expected digit in exponent", line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string_view text = input_.substr(start_pos, pos_ - start_pos);
    JsonToken tok = make_token(is_float ? JsonTokenKind::FloatNumber : JsonTokenKind::IntNumber,
                               start_pos, start_line, start_col);

    if (!is_float) {
        int64_t ivalue = 0;
        auto [iptr, iec] = std::from_chars(text.data(), text.data() + text.size(), ivalue);
        if (iec == std::errc{}) {
            tok.number_value = JsonNumber(ivalue);
            return tok;
        }
        uint64_t uvalue = 0;
        auto [uptr, uec] = std::from_chars(text.data(), text.data() + text.size(), uvalue);
        if (uec == std::errc{}) {
            tok.number_value = JsonNumber(uvalue);
            return tok;
        }
        // Out of range for both integer kinds
        tok.kind = JsonTokenKind::FloatNumber;
    }

    tok.number_value = JsonNumber(std::strtod(std::string(text).c_str(), nullptr));
    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);
    if (word == "true") {
        return make_token(JsonTokenKind::True, start_pos, start_line, start_col);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_pos, start_line, start_col);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_pos, start_line, start_col);
    }

    add_error("Unknown keyword: " + std::string(word), start_line, start_col);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    if (pos_ >= input_.size()) {
        return make_token(JsonTokenKind::Eof, start_pos, start_line, start_col);
    }

    char c = peek();
    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start_line, start_col);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start_line, start_col);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start_line, start_col);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start_line, start_col);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start_line, start_col);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start_line, start_col);
    case '"':
        return scan_string();
    case 't':
    case 'f':
    case 'n':
        return scan_keyword();
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return scan_number();
        }
        advance();
        add_error("Unexpected character: " + std::string(1, c), start_line, start_col);
        return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    }
}

// ============================================================================
// JsonParser
// ============================================================================

JsonParser::JsonParser(std::string_view input) : lexer_(input) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::match(JsonTokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    // Prefer the lexer's own diagnostic when the current token is a lex error
    if (current_.kind == JsonTokenKind::Error && !lexer_.errors().empty()) {
        return lexer_.errors().back();
    }
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    if (!check(JsonTokenKind::Eof)) {
        return make_error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    switch (current_.kind) {
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::String: {
        JsonValue value(std::move(current_.string_value));
        advance();
        return value;
    }
    case JsonTokenKind::IntNumber:
    case JsonTokenKind::FloatNumber: {
        JsonValue value(current_.number_value);
        advance();
        return value;
    }
    case JsonTokenKind::True:
        advance();
        return JsonValue(true);
    case JsonTokenKind::False:
        advance();
        return JsonValue(false);
    case JsonTokenKind::Null:
        advance();
        return JsonValue();
    case JsonTokenKind::Eof:
        return make_error("Unexpected end of input");
    default:
        return make_error("Expected a JSON value");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject obj;
    if (!match(JsonTokenKind::RBrace)) {
        while (true) {
            if (!check(JsonTokenKind::String)) {
                return make_error("Expected string key in object");
            }
            std::string key = std::move(current_.string_value);
            advance();

            if (!match(JsonTokenKind::Colon)) {
                return make_error("Expected ':' after object key");
            }

            auto value = parse_value();
            if (is_err(value)) {
                return value;
            }
            obj.insert_or_assign(std::move(key), std::move(unwrap(value)));

            if (match(JsonTokenKind::Comma)) {
                continue;
            }
            if (match(JsonTokenKind::RBrace)) {
                break;
            }
            return make_error("Expected ',' or '}' in object");
        }
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray arr;
    if (!match(JsonTokenKind::RBracket)) {
        while (true) {
            auto value = parse_value();
            if (is_err(value)) {
                return value;
            }
            arr.push_back(std::move(unwrap(value)));

            if (match(JsonTokenKind::Comma)) {
                continue;
            }
            if (match(JsonTokenKind::RBracket)) {
                break;
            }
            return make_error("Expected ',' or ']' in array");
        }
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace twbuild::json

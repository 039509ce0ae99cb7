//! # JSON Parser
//!
//! A lexer plus recursive descent parser producing `JsonValue` trees. Used to
//! read metadata description files.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"types": []})");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace argschema::json {

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

/// A token with its position. `text` holds the unescaped string content for
/// `String` tokens and the error message for `Error` tokens.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    std::string text;
    int64_t int_value = 0;
    double float_value = 0.0;
    size_t line = 1;
    size_t column = 1;
    size_t offset = 0;
};

// ============================================================================
// Lexer
// ============================================================================

class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token; `Eof` at end of input, `Error` on bad input.
    auto next_token() -> JsonToken;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    auto make_token(JsonTokenKind kind, size_t line, size_t column, size_t offset) const
        -> JsonToken;
    auto make_error(std::string message, size_t line, size_t column, size_t offset) const
        -> JsonToken;
    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent parser with a nesting limit.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    static constexpr size_t MAX_DEPTH = 256;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;
    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

/// Parses a complete JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace argschema::json

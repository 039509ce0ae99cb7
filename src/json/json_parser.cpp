//! # JSON Parser Implementation
//!
//! Two stages:
//!
//! 1. **Lexing**: `JsonLexer` converts the input into tokens, unescaping
//!    strings and classifying numbers as integer or floating point.
//! 2. **Parsing**: `JsonParser` builds the `JsonValue` tree, rejecting
//!    trailing content and nesting deeper than `MAX_DEPTH`.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace argschema::json {

// ============================================================================
// JsonLexer
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonLexer::advance() -> char {
    char c = peek();
    ++pos_;
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
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t line, size_t column, size_t offset) const
    -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.line = line;
    tok.column = column;
    tok.offset = offset;
    return tok;
}

auto JsonLexer::make_error(std::string message, size_t line, size_t column, size_t offset) const
    -> JsonToken {
    JsonToken tok = make_token(JsonTokenKind::Error, line, column, offset);
    tok.text = std::move(message);
    return tok;
}

/// Appends a code point as UTF-8.
static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto JsonLexer::scan_string() -> JsonToken {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;
    advance(); // opening quote

    std::string value;
    while (true) {
        if (pos_ >= input_.size()) {
            return make_error("unterminated string", start_line, start_col, start_pos);
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("control character in string", start_line, start_col, start_pos);
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char esc = advance();
        switch (esc) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
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
                return make_error("truncated \\u escape", line_, column_, pos_);
            }
            uint32_t cp = 0;
            auto hex = input_.substr(pos_, 4);
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, cp, 16);
            if (ec != std::errc{} || ptr != hex.data() + 4) {
                return make_error("invalid \\u escape", line_, column_, pos_);
            }
            for (int i = 0; i < 4; ++i) {
                advance();
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return make_error(std::string("invalid escape '\\") + esc + "'", line_, column_, pos_);
        }
    }

    JsonToken tok = make_token(JsonTokenKind::String, start_line, start_col, start_pos);
    tok.text = std::move(value);
    return tok;
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        return make_error("expected digit", line_, column_, pos_);
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return make_error("expected digit after '.'", line_, column_, pos_);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return make_error("expected digit in exponent", line_, column_, pos_);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    auto lexeme = input_.substr(start_pos, pos_ - start_pos);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), value);
        if (ec == std::errc{} && ptr == lexeme.data() + lexeme.size()) {
            JsonToken tok = make_token(JsonTokenKind::IntNumber, start_line, start_col, start_pos);
            tok.int_value = value;
            return tok;
        }
        // Out of int64 range: fall through to double
    }

    JsonToken tok = make_token(JsonTokenKind::FloatNumber, start_line, start_col, start_pos);
    tok.float_value = std::strtod(std::string(lexeme).c_str(), nullptr);
    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;

    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }
    auto word = input_.substr(start_pos, pos_ - start_pos);
    if (word == "true") {
        return make_token(JsonTokenKind::True, start_line, start_col, start_pos);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_line, start_col, start_pos);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_line, start_col, start_pos);
    }
    return make_error("unknown literal '" + std::string(word) + "'", start_line, start_col,
                      start_pos);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    if (pos_ >= input_.size()) {
        return make_token(JsonTokenKind::Eof, line_, column_, pos_);
    }

    char c = peek();
    size_t line = line_;
    size_t column = column_;
    size_t offset = pos_;

    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, line, column, offset);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, line, column, offset);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, line, column, offset);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, line, column, offset);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, line, column, offset);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, line, column, offset);
    case '"':
        return scan_string();
    default:
        break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return scan_number();
    }
    if (std::isalpha(static_cast<unsigned char>(c))) {
        return scan_keyword();
    }

    advance();
    return make_error(std::string("unexpected character '") + c + "'", line, column, offset);
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

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    if (current_.kind != JsonTokenKind::Eof) {
        return make_error("unexpected content after document");
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
        JsonValue value(std::move(current_.text));
        advance();
        return value;
    }
    case JsonTokenKind::IntNumber: {
        JsonValue value(current_.int_value);
        advance();
        return value;
    }
    case JsonTokenKind::FloatNumber: {
        JsonValue value(current_.float_value);
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
        return JsonValue(nullptr);
    case JsonTokenKind::Error:
        return make_error(current_.text);
    case JsonTokenKind::Eof:
        return make_error("unexpected end of input");
    default:
        return make_error("expected a value");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("nesting too deep");
    }
    advance(); // '{'

    JsonObject obj;
    if (current_.kind == JsonTokenKind::RBrace) {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (current_.kind != JsonTokenKind::String) {
            return make_error("expected string key");
        }
        std::string key = std::move(current_.text);
        advance();

        if (current_.kind != JsonTokenKind::Colon) {
            return make_error("expected ':' after key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(key)] = std::move(unwrap(value));

        if (current_.kind == JsonTokenKind::Comma) {
            advance();
            continue;
        }
        if (current_.kind == JsonTokenKind::RBrace) {
            advance();
            break;
        }
        return make_error("expected ',' or '}' in object");
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return make_error("nesting too deep");
    }
    advance(); // '['

    JsonArray arr;
    if (current_.kind == JsonTokenKind::RBracket) {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        if (current_.kind == JsonTokenKind::Comma) {
            advance();
            continue;
        }
        if (current_.kind == JsonTokenKind::RBracket) {
            advance();
            break;
        }
        return make_error("expected ',' or ']' in array");
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace argschema::json

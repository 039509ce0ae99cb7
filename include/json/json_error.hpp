//! # JSON Error Types
//!
//! Errors produced while parsing JSON metadata files. Each carries the input
//! position so the CLI can point at the offending line.

#pragma once

#include <cstddef>
#include <string>

namespace argschema::json {

/// An error encountered during JSON parsing.
///
/// `line` and `column` are 1-based; 0 means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats as `"line X, column Y: message"`, dropping unknown parts.
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

} // namespace argschema::json

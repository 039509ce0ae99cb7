//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! argschema. Every other component depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Source Locations**: Declaration positions reported with diagnostics
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Expected failures are returned via `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef ARGSCHEMA_COMMON_HPP
#define ARGSCHEMA_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace argschema {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location
// ============================================================================

/// Position of a declaration, as supplied by the metadata provider.
///
/// A location with an empty `file` and zero line is "unknown"; diagnostics
/// still carry it so a sink can decide how to render it.
struct SourceLocation {
    /// Path of the declaring source file.
    std::string file;

    /// Line number (1-based, 0 if unknown).
    uint32_t line = 0;

    /// Column number (1-based, 0 if unknown).
    uint32_t column = 0;

    [[nodiscard]] auto is_known() const -> bool {
        return !file.empty() || line > 0;
    }

    /// Formats as `file:line:column`, dropping unknown parts.
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = file.empty() ? "<unknown>" : file;
        if (line > 0) {
            out += ":" + std::to_string(line);
            if (column > 0) {
                out += ":" + std::to_string(column);
            }
        }
        return out;
    }

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<MetadataStore, std::string> load(std::string_view path);
///
/// auto result = load("options.json");
/// if (is_err(result)) {
///     ARGSCHEMA_LOG_ERROR("cli", unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace argschema

#endif // ARGSCHEMA_COMMON_HPP

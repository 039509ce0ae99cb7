//! # Case Folding
//!
//! Case-insensitive comparison of UTF-8 names.
//!
//! Argument names, group names and attribute namespaces compare the way an
//! ordinal ignore-case comparison does: code point by code point after a
//! simple (one-to-one) case mapping. Letters outside ASCII fold too, so
//! `Éteindre` and `éteindre` name the same group.
//!
//! ## Folding Rules
//!
//! | Input                 | Folded as                                  |
//! |-----------------------|--------------------------------------------|
//! | Uppercase letter      | Its simple lowercase mapping               |
//! | Final sigma `ς`       | `σ`                                        |
//! | Other code point      | Unchanged                                  |
//! | Malformed UTF-8 byte  | A private marker, distinct per byte value  |
//!
//! Mappings that change length (`ß` to `ss`) and locale rules (Turkish
//! dotted `İ`) are not applied.

#ifndef ARGSCHEMA_TEXT_CASE_FOLD_HPP
#define ARGSCHEMA_TEXT_CASE_FOLD_HPP

#include <string>
#include <string_view>

namespace argschema::text {

/// Decodes the code point at `pos` and advances past it.
///
/// A malformed or truncated sequence consumes one byte and yields
/// `0xDC00 + byte`, so distinct invalid bytes never compare equal.
[[nodiscard]] auto decode_utf8(std::string_view s, size_t& pos) -> char32_t;

/// Appends `cp` encoded as UTF-8.
void encode_utf8(std::string& out, char32_t cp);

/// Simple case fold of a single code point.
[[nodiscard]] auto fold_code_point(char32_t cp) -> char32_t;

/// Case-folded copy of `s`, usable as a lookup key.
[[nodiscard]] auto fold_case(std::string_view s) -> std::string;

/// True when `a` and `b` are equal after case folding.
[[nodiscard]] auto equals_ignore_case(std::string_view a, std::string_view b) -> bool;

} // namespace argschema::text

#endif // ARGSCHEMA_TEXT_CASE_FOLD_HPP

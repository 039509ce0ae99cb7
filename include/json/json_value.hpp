//! # JSON Value Types
//!
//! The value tree produced by the JSON parser and consumed by the metadata
//! loader. Also used to build the machine-readable diagnostic output.
//!
//! ## Number Handling
//!
//! | JSON Input | Storage   |
//! |------------|-----------|
//! | `42`       | `int64_t` |
//! | `3.14`     | `double`  |
//! | `1e10`     | `double`  |
//!
//! Attribute constructor arguments keep the integer/floating distinction, so
//! a position written as `0` stays an integer.
//!
//! ## Example
//!
//! ```cpp
//! JsonValue obj(JsonObject{{"rule", JsonValue("ARG006")}, {"line", JsonValue(int64_t{4})}});
//! if (auto* rule = obj.get("rule"); rule && rule->is_string()) {
//!     std::cout << rule->as_string() << "\n";
//! }
//! ```

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace argschema::json {

struct JsonValue;

/// Ordered values.
using JsonArray = std::vector<JsonValue>;

/// Key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON value: null, bool, integer, double, string, array or object.
struct JsonValue {
    using Storage =
        std::variant<std::nullptr_t, bool, int64_t, double, std::string, JsonArray, JsonObject>;

    Storage data;

    JsonValue() : data(nullptr) {}
    JsonValue(std::nullptr_t) : data(nullptr) {}
    JsonValue(bool b) : data(b) {}
    JsonValue(int i) : data(static_cast<int64_t>(i)) {}
    JsonValue(int64_t i) : data(i) {}
    JsonValue(uint32_t i) : data(static_cast<int64_t>(i)) {}
    JsonValue(double d) : data(d) {}
    JsonValue(const char* s) : data(std::string(s)) {}
    JsonValue(std::string s) : data(std::move(s)) {}
    JsonValue(JsonArray a) : data(std::move(a)) {}
    JsonValue(JsonObject o) : data(std::move(o)) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<std::nullptr_t>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] auto is_double() const -> bool {
        return std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || is_double();
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<JsonArray>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<JsonObject>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // These throw std::bad_variant_access on a kind mismatch; check first.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t {
        return std::get<int64_t>(data);
    }
    /// Integers are widened.
    [[nodiscard]] auto as_f64() const -> double {
        if (is_integer()) {
            return static_cast<double>(std::get<int64_t>(data));
        }
        return std::get<double>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return std::get<JsonArray>(data);
    }
    [[nodiscard]] auto as_array() -> JsonArray& {
        return std::get<JsonArray>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return std::get<JsonObject>(data);
    }
    [[nodiscard]] auto as_object() -> JsonObject& {
        return std::get<JsonObject>(data);
    }

    /// Returns the member named `key`, or nullptr if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Sets an object member. Converts a null value into an empty object first.
    void set(const std::string& key, JsonValue value);

    /// Appends to an array. Converts a null value into an empty array first.
    void push(JsonValue value);

    /// Compact serialization (no whitespace).
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

/// Escapes a string for inclusion in JSON output, without surrounding quotes.
[[nodiscard]] auto escape_json_string(const std::string& s) -> std::string;

} // namespace argschema::json

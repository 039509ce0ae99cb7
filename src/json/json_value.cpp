//! # JSON Value Implementation
//!
//! Object/array mutation helpers and compact serialization.

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace argschema::json {

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = std::get<JsonObject>(data);
    auto it = obj.find(key);
    return it != obj.end() ? &it->second : nullptr;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    return data == other.data;
}

void JsonValue::set(const std::string& key, JsonValue value) {
    if (is_null()) {
        data = JsonObject{};
    }
    std::get<JsonObject>(data)[key] = std::move(value);
}

void JsonValue::push(JsonValue value) {
    if (is_null()) {
        data = JsonArray{};
    }
    std::get<JsonArray>(data).push_back(std::move(value));
}

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream oss;
    for (unsigned char c : s) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\b':
            oss << "\\b";
            break;
        case '\f':
            oss << "\\f";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (c < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
            } else {
                oss << static_cast<char>(c);
            }
        }
    }
    return oss.str();
}

namespace {

void serialize(const JsonValue& value, std::ostringstream& out) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                out << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int64_t>) {
                out << v;
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    out << "null";
                } else {
                    std::ostringstream num;
                    num << std::setprecision(17) << v;
                    out << num.str();
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                out << '"' << escape_json_string(v) << '"';
            } else if constexpr (std::is_same_v<T, JsonArray>) {
                out << '[';
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0)
                        out << ',';
                    serialize(v[i], out);
                }
                out << ']';
            } else {
                out << '{';
                bool first = true;
                for (const auto& [key, item] : v) {
                    if (!first)
                        out << ',';
                    first = false;
                    out << '"' << escape_json_string(key) << "\":";
                    serialize(item, out);
                }
                out << '}';
            }
        },
        value.data);
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::ostringstream out;
    serialize(*this, out);
    return out.str();
}

} // namespace argschema::json

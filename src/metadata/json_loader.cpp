//! # JSON Metadata Loader Implementation
//!
//! Structural problems in the document (wrong JSON kinds, missing names) fail
//! the whole load; the analyzer never sees a half-built store.

#include "metadata/json_loader.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <fstream>
#include <limits>
#include <sstream>

namespace argschema::metadata {

namespace {

using json::JsonValue;

/// Conversion context: carries the source name for error messages.
struct Loader {
    std::string_view source;

    auto fail(const std::string& where, const std::string& what) const -> std::string {
        return std::string(source) + ": " + where + ": " + what;
    }

    auto optional_string(const JsonValue& obj, const char* key, std::string& out,
                         const std::string& where) const -> std::optional<std::string> {
        const JsonValue* value = obj.get(key);
        if (!value || value->is_null()) {
            return std::nullopt;
        }
        if (!value->is_string()) {
            return fail(where, std::string("'") + key + "' must be a string");
        }
        out = value->as_string();
        return std::nullopt;
    }

    auto optional_u32(const JsonValue& obj, const char* key, uint32_t& out,
                      const std::string& where) const -> std::optional<std::string> {
        const JsonValue* value = obj.get(key);
        if (!value || value->is_null()) {
            return std::nullopt;
        }
        if (!value->is_integer() || value->as_i64() < 0 ||
            value->as_i64() > std::numeric_limits<uint32_t>::max()) {
            return fail(where, std::string("'") + key + "' must be a non-negative integer");
        }
        out = static_cast<uint32_t>(value->as_i64());
        return std::nullopt;
    }

    auto to_constant(const JsonValue& value, const std::string& where) const
        -> Result<TypedConstant, std::string> {
        if (value.is_null()) {
            return TypedConstant{};
        }
        if (value.is_bool()) {
            return constant(value.as_bool());
        }
        if (value.is_integer()) {
            return constant(value.as_i64());
        }
        if (value.is_double()) {
            return constant(value.as_f64());
        }
        if (value.is_string()) {
            return constant(value.as_string());
        }
        return fail(where, "attribute arguments must be literals");
    }

    auto to_attribute(const JsonValue& value, const std::string& where) const
        -> Result<AttributeData, std::string> {
        if (!value.is_object()) {
            return fail(where, "attribute must be an object");
        }

        AttributeData attr;
        if (auto err = optional_string(value, "name", attr.class_name, where)) {
            return *err;
        }
        if (attr.class_name.empty()) {
            return fail(where, "attribute is missing 'name'");
        }
        if (auto err = optional_string(value, "namespace", attr.namespace_name, where)) {
            return *err;
        }

        if (const JsonValue* args = value.get("args"); args && !args->is_null()) {
            if (!args->is_array()) {
                return fail(where, "'args' must be an array");
            }
            for (const auto& arg : args->as_array()) {
                auto converted = to_constant(arg, where + " (" + attr.class_name + ")");
                if (is_err(converted)) {
                    return unwrap_err(converted);
                }
                attr.constructor_args.push_back(std::move(unwrap(converted)));
            }
        }
        return attr;
    }

    auto to_member(const JsonValue& value, const TypeSymbol& owner, size_t index) const
        -> Result<MemberSymbol, std::string> {
        std::string where = owner.name + ".members[" + std::to_string(index) + "]";
        if (!value.is_object()) {
            return fail(where, "member must be an object");
        }

        MemberSymbol member;
        member.location.file = owner.location.file;
        if (auto err = optional_string(value, "name", member.name, where)) {
            return *err;
        }
        if (member.name.empty()) {
            return fail(where, "member is missing 'name'");
        }
        where = owner.name + "." + member.name;

        std::string kind;
        if (auto err = optional_string(value, "kind", kind, where)) {
            return *err;
        }
        if (kind.empty() || kind == "property") {
            member.kind = MemberKind::Property;
        } else if (kind == "field") {
            member.kind = MemberKind::Field;
        } else if (kind == "method") {
            member.kind = MemberKind::Method;
        } else {
            return fail(where, "unknown member kind '" + kind + "'");
        }

        if (auto err = optional_string(value, "type", member.declared_type, where)) {
            return *err;
        }
        if (auto err = optional_string(value, "file", member.location.file, where)) {
            return *err;
        }
        if (auto err = optional_u32(value, "line", member.location.line, where)) {
            return *err;
        }
        if (auto err = optional_u32(value, "column", member.location.column, where)) {
            return *err;
        }

        if (const JsonValue* attrs = value.get("attributes"); attrs && !attrs->is_null()) {
            if (!attrs->is_array()) {
                return fail(where, "'attributes' must be an array");
            }
            for (const auto& attr_value : attrs->as_array()) {
                auto attr = to_attribute(attr_value, where);
                if (is_err(attr)) {
                    return unwrap_err(attr);
                }
                member.attributes.push_back(std::move(unwrap(attr)));
            }
        }
        return member;
    }

    auto to_type(const JsonValue& value, size_t index) const -> Result<TypeSymbol, std::string> {
        std::string where = "types[" + std::to_string(index) + "]";
        if (!value.is_object()) {
            return fail(where, "type must be an object");
        }

        TypeSymbol type;
        if (auto err = optional_string(value, "name", type.name, where)) {
            return *err;
        }
        if (type.name.empty()) {
            return fail(where, "type is missing 'name'");
        }
        where = type.name;

        std::string kind;
        if (auto err = optional_string(value, "kind", kind, where)) {
            return *err;
        }
        if (kind.empty() || kind == "class") {
            type.kind = TypeKind::Class;
        } else if (kind == "struct") {
            type.kind = TypeKind::Struct;
        } else if (kind == "enum") {
            type.kind = TypeKind::Enum;
        } else {
            return fail(where, "unknown type kind '" + kind + "'");
        }

        if (auto err = optional_string(value, "file", type.location.file, where)) {
            return *err;
        }
        if (auto err = optional_u32(value, "line", type.location.line, where)) {
            return *err;
        }
        if (auto err = optional_u32(value, "column", type.location.column, where)) {
            return *err;
        }

        if (const JsonValue* constants = value.get("constants"); constants && !constants->is_null()) {
            if (!constants->is_array()) {
                return fail(where, "'constants' must be an array");
            }
            for (const auto& c : constants->as_array()) {
                if (!c.is_string()) {
                    return fail(where, "enum constants must be strings");
                }
                type.enum_constants.push_back(c.as_string());
            }
        }

        if (const JsonValue* members = value.get("members"); members && !members->is_null()) {
            if (!members->is_array()) {
                return fail(where, "'members' must be an array");
            }
            const auto& list = members->as_array();
            for (size_t i = 0; i < list.size(); ++i) {
                auto member = to_member(list[i], type, i);
                if (is_err(member)) {
                    return unwrap_err(member);
                }
                type.members.push_back(std::move(unwrap(member)));
            }
        }
        return type;
    }
};

} // namespace

auto load_metadata(const json::JsonValue& document, std::string_view source_name)
    -> Result<MetadataStore, std::string> {
    Loader loader{source_name};

    if (!document.is_object()) {
        return loader.fail("document", "root must be an object");
    }
    const JsonValue* types = document.get("types");
    if (!types || !types->is_array()) {
        return loader.fail("document", "'types' must be an array");
    }

    MetadataStore store;
    const auto& list = types->as_array();
    for (size_t i = 0; i < list.size(); ++i) {
        auto type = loader.to_type(list[i], i);
        if (is_err(type)) {
            return unwrap_err(type);
        }
        store.add_type(std::move(unwrap(type)));
    }

    ARGSCHEMA_LOG_DEBUG("metadata", "Loaded " << store.size() << " types from " << source_name);
    return store;
}

auto load_metadata_from_string(std::string_view text, std::string_view source_name)
    -> Result<MetadataStore, std::string> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return std::string(source_name) + ": " + unwrap_err(parsed).to_string();
    }
    return load_metadata(unwrap(parsed), source_name);
}

auto load_metadata_file(const std::filesystem::path& path) -> Result<MetadataStore, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "cannot open " + path.string();
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return load_metadata_from_string(buffer.str(), path.string());
}

} // namespace argschema::metadata

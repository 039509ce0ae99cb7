//! # Type and Member Metadata
//!
//! The symbol model handed to the analyzer by a metadata provider: types with
//! their ordered members, members with their attributes, attributes with
//! position-indexed constant arguments.
//!
//! ## Components
//!
//! | Type               | Description                                       |
//! |--------------------|---------------------------------------------------|
//! | `TypedConstant`    | One literal constructor argument                  |
//! | `AttributeData`    | An attribute application on a member              |
//! | `MemberSymbol`     | A declared property, field or method              |
//! | `TypeSymbol`       | A class, struct or enumeration                    |
//! | `MetadataProvider` | Abstract lookup interface consumed by the analyzer|
//! | `MetadataStore`    | Owning in-memory provider                         |
//!
//! Members are identified by address. A `MetadataStore` never moves a member
//! once its type has been added, so `const MemberSymbol*` handles stay valid
//! for the lifetime of the store.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace argschema::metadata {

// ============================================================================
// Typed Constants
// ============================================================================

/// A literal attribute argument.
struct TypedConstant {
    using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

    /// `std::monostate` is a null literal.
    Value value;

    TypedConstant() = default;
    explicit TypedConstant(Value v) : value(std::move(v)) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<std::monostate>(value);
    }

    [[nodiscard]] auto as_int() const -> std::optional<int64_t> {
        if (auto* i = std::get_if<int64_t>(&value)) {
            return *i;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto as_bool() const -> std::optional<bool> {
        if (auto* b = std::get_if<bool>(&value)) {
            return *b;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto as_string() const -> std::optional<std::string> {
        if (auto* s = std::get_if<std::string>(&value)) {
            return *s;
        }
        return std::nullopt;
    }

    /// Renders the literal the way it would be written in source
    /// (`null`, `true`, `42`, `"text"`).
    [[nodiscard]] auto to_display() const -> std::string;

    [[nodiscard]] auto operator==(const TypedConstant& other) const -> bool = default;
};

/// Builds a constant from a C++ literal.
inline auto constant(std::nullptr_t) -> TypedConstant {
    return TypedConstant{};
}
inline auto constant(bool b) -> TypedConstant {
    return TypedConstant{b};
}
inline auto constant(int i) -> TypedConstant {
    return TypedConstant{static_cast<int64_t>(i)};
}
inline auto constant(int64_t i) -> TypedConstant {
    return TypedConstant{i};
}
inline auto constant(double d) -> TypedConstant {
    return TypedConstant{d};
}
inline auto constant(const char* s) -> TypedConstant {
    return TypedConstant{std::string(s)};
}
inline auto constant(std::string s) -> TypedConstant {
    return TypedConstant{std::move(s)};
}

// ============================================================================
// Attributes and Members
// ============================================================================

/// An attribute applied to a member.
struct AttributeData {
    /// Namespace (or assembly) the attribute class is declared in.
    std::string namespace_name;

    /// Attribute class name, e.g. `RequiredArgumentAttribute`.
    std::string class_name;

    /// Constructor arguments in declaration order.
    std::vector<TypedConstant> constructor_args;
};

enum class MemberKind { Property, Field, Method };

enum class TypeKind { Class, Struct, Enum };

[[nodiscard]] auto member_kind_name(MemberKind kind) -> const char*;
[[nodiscard]] auto type_kind_name(TypeKind kind) -> const char*;

/// A declared member of a type.
struct MemberSymbol {
    std::string name;
    MemberKind kind = MemberKind::Property;

    /// Name of the declared type; resolved through the provider. Empty for
    /// members without a value type.
    std::string declared_type;

    SourceLocation location;
    std::vector<AttributeData> attributes;
};

/// A declared type.
struct TypeSymbol {
    std::string name;
    TypeKind kind = TypeKind::Class;
    SourceLocation location;

    /// Members in declaration order. Empty for enumerations.
    std::vector<MemberSymbol> members;

    /// Constant names in declaration order. Only used for enumerations.
    std::vector<std::string> enum_constants;

    [[nodiscard]] auto is_enum() const -> bool {
        return kind == TypeKind::Enum;
    }
};

// ============================================================================
// Provider
// ============================================================================

/// Supplies type metadata to the analyzer.
///
/// Implementations must be safe for concurrent reads: the analyzer may query
/// one provider from several worker threads.
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    /// All types, in a stable order.
    [[nodiscard]] virtual auto types() const -> std::vector<const TypeSymbol*> = 0;

    /// Looks up a type by exact name. Returns nullptr if unknown (built-in
    /// types such as `string` or `int` are usually unknown).
    [[nodiscard]] virtual auto find_type(std::string_view name) const -> const TypeSymbol* = 0;

    /// Resolves a member's declared type.
    [[nodiscard]] auto declared_type_of(const MemberSymbol& member) const -> const TypeSymbol* {
        if (member.declared_type.empty()) {
            return nullptr;
        }
        return find_type(member.declared_type);
    }
};

/// Owning, immutable-after-construction metadata provider.
class MetadataStore : public MetadataProvider {
public:
    MetadataStore() = default;
    MetadataStore(MetadataStore&&) = default;
    MetadataStore& operator=(MetadataStore&&) = default;
    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /// Adds a type. A later type with the same name shadows the earlier one
    /// for `find_type`, but both are still listed by `types()`.
    auto add_type(TypeSymbol type) -> const TypeSymbol&;

    [[nodiscard]] auto types() const -> std::vector<const TypeSymbol*> override;
    [[nodiscard]] auto find_type(std::string_view name) const -> const TypeSymbol* override;

    [[nodiscard]] auto size() const -> size_t {
        return types_.size();
    }

private:
    // Boxed so member addresses survive vector growth.
    std::vector<Box<TypeSymbol>> types_;
    std::unordered_map<std::string, const TypeSymbol*> by_name_;
};

} // namespace argschema::metadata

//! # Argument Annotations and the Metadata Reader
//!
//! Annotations are the recognized attributes on a member, decoded into a
//! closed variant:
//!
//! | Attribute class               | Annotation       | Constructor values                        |
//! |-------------------------------|------------------|-------------------------------------------|
//! | `RequiredArgument[Attribute]` | `RequiredMarker` | position, name, description[, collection] |
//! | `OptionalArgument[Attribute]` | `OptionalMarker` | default, name, description[, collection]  |
//! | `CommonArgument[Attribute]`   | `CommonMarker`   | -                                         |
//! | `ArgumentGroup[Attribute]`    | `GroupMarker`    | group name                                |
//! | `ActionArgument[Attribute]`   | `ActionMarker`   | -                                         |
//!
//! The reader only looks; it never validates and never fails.

#pragma once

#include "metadata/symbol.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace argschema::schema {

// ============================================================================
// Annotations
// ============================================================================

struct RequiredMarker {
    int position = 0;
    std::string name;
    std::string description;
    bool is_collection = false;
};

struct OptionalMarker {
    metadata::TypedConstant default_value;
    std::string name;
    std::string description;
    bool is_collection = false;
};

struct CommonMarker {};

struct GroupMarker {
    std::string group_name;
};

struct ActionMarker {};

using Annotation =
    std::variant<RequiredMarker, OptionalMarker, CommonMarker, GroupMarker, ActionMarker>;

/// A member carrying at least one attribute from the recognized namespace,
/// with the annotations decoded from those attributes. `annotations` can be
/// empty when every recognized attribute was unknown or malformed.
struct AnnotatedMember {
    const metadata::MemberSymbol* member = nullptr;
    std::vector<Annotation> annotations;

    template <typename T> [[nodiscard]] auto has() const -> bool {
        for (const auto& a : annotations) {
            if (std::holds_alternative<T>(a)) {
                return true;
            }
        }
        return false;
    }
};

// ============================================================================
// Metadata Reader
// ============================================================================

class MetadataReader {
public:
    explicit MetadataReader(std::string annotation_namespace = "CommandLine");

    /// Annotated members of `type` in declaration order. Empty when the type
    /// has no attribute from the recognized namespace.
    [[nodiscard]] auto read(const metadata::TypeSymbol& type) const -> std::vector<AnnotatedMember>;

    /// Decoded annotations of one member; attributes from other namespaces
    /// are ignored.
    [[nodiscard]] auto read_member(const metadata::MemberSymbol& member) const
        -> std::vector<Annotation>;

    [[nodiscard]] auto is_recognized(const metadata::AttributeData& attribute) const -> bool;

    /// Decodes one attribute. Returns nullopt for unknown class names and for
    /// markers with missing or mistyped constructor values.
    [[nodiscard]] auto decode(const metadata::AttributeData& attribute) const
        -> std::optional<Annotation>;

private:
    std::string namespace_;
};

} // namespace argschema::schema

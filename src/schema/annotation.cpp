//! # Metadata Reader
//!
//! Decodes recognized attributes into annotations.
//!
//! ## Decoding Rules
//!
//! - Required and optional markers need at least three constructor values;
//!   with fewer the attribute decodes to nothing.
//! - A required marker's position must be an integer that fits `int`;
//!   otherwise the marker is dropped with a warning.
//! - Name and description read as empty strings unless they are strings.
//! - A fourth bool value sets `is_collection`.
//! - A group marker needs a string group name.

#include "schema/annotation.hpp"

#include "log/log.hpp"
#include "text/case_fold.hpp"

#include <limits>

namespace argschema::schema {

namespace {

/// Matches `Name` and `NameAttribute`.
auto class_is(const std::string& class_name, std::string_view base) -> bool {
    if (class_name == base) {
        return true;
    }
    constexpr std::string_view suffix = "Attribute";
    return class_name.size() == base.size() + suffix.size() && class_name.starts_with(base) &&
           class_name.ends_with(suffix);
}

auto string_arg(const metadata::AttributeData& attr, size_t index) -> std::string {
    return attr.constructor_args[index].as_string().value_or("");
}

/// The position of a required marker, if it is an integer that fits `int`.
auto int_position(const metadata::TypedConstant& value) -> std::optional<int> {
    auto position = value.as_int();
    if (!position || *position < std::numeric_limits<int>::min() ||
        *position > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*position);
}

auto collection_arg(const metadata::AttributeData& attr) -> bool {
    if (attr.constructor_args.size() < 4) {
        return false;
    }
    return attr.constructor_args[3].as_bool().value_or(false);
}

} // namespace

MetadataReader::MetadataReader(std::string annotation_namespace)
    : namespace_(std::move(annotation_namespace)) {}

auto MetadataReader::is_recognized(const metadata::AttributeData& attribute) const -> bool {
    return text::equals_ignore_case(attribute.namespace_name, namespace_);
}

auto MetadataReader::decode(const metadata::AttributeData& attribute) const
    -> std::optional<Annotation> {
    const auto& cls = attribute.class_name;
    const auto& args = attribute.constructor_args;

    if (class_is(cls, "RequiredArgument")) {
        if (args.size() < 3) {
            return std::nullopt;
        }
        auto position = int_position(args[0]);
        if (!position) {
            return std::nullopt;
        }
        return RequiredMarker{*position, string_arg(attribute, 1), string_arg(attribute, 2),
                              collection_arg(attribute)};
    }

    if (class_is(cls, "OptionalArgument")) {
        if (args.size() < 3) {
            return std::nullopt;
        }
        return OptionalMarker{args[0], string_arg(attribute, 1), string_arg(attribute, 2),
                              collection_arg(attribute)};
    }

    if (class_is(cls, "CommonArgument")) {
        return CommonMarker{};
    }

    if (class_is(cls, "ArgumentGroup")) {
        if (args.empty()) {
            return std::nullopt;
        }
        auto group = args[0].as_string();
        if (!group) {
            return std::nullopt;
        }
        return GroupMarker{*group};
    }

    if (class_is(cls, "ActionArgument")) {
        return ActionMarker{};
    }

    return std::nullopt;
}

auto MetadataReader::read_member(const metadata::MemberSymbol& member) const
    -> std::vector<Annotation> {
    std::vector<Annotation> annotations;
    for (const auto& attr : member.attributes) {
        if (!is_recognized(attr)) {
            continue;
        }
        if (auto annotation = decode(attr)) {
            annotations.push_back(std::move(*annotation));
        } else if (class_is(attr.class_name, "RequiredArgument") &&
                   attr.constructor_args.size() >= 3) {
            // Only the position can reject a required marker with enough values.
            ARGSCHEMA_LOG_WARN("reader", member.location.to_string()
                                             << ": " << member.name << ": position "
                                             << attr.constructor_args[0].to_display()
                                             << " is not a 32-bit integer; "
                                             << attr.class_name << " ignored");
        } else {
            ARGSCHEMA_LOG_TRACE("reader", "Ignoring " << attr.class_name << " on " << member.name
                                                      << " (" << attr.constructor_args.size()
                                                      << " constructor values)");
        }
    }
    return annotations;
}

auto MetadataReader::read(const metadata::TypeSymbol& type) const -> std::vector<AnnotatedMember> {
    std::vector<AnnotatedMember> result;
    for (const auto& member : type.members) {
        bool recognized = false;
        for (const auto& attr : member.attributes) {
            if (is_recognized(attr)) {
                recognized = true;
                break;
            }
        }
        if (!recognized) {
            continue;
        }
        result.push_back(AnnotatedMember{&member, read_member(member)});
    }
    return result;
}

} // namespace argschema::schema

//! # Classified Arguments and Groups
//!
//! The schema reconstructed from a type's annotations:
//!
//! - `Argument`: a required (positional) or optional (named) argument,
//!   pointing back at its source member for diagnostic locations.
//! - `ActionArgument`: the member selecting the active mode and the group
//!   names its enumeration legalizes.
//! - `GroupMap`: group name to ordered arguments. Lookup ignores case;
//!   iteration follows insertion order; the first spelling of a name is kept.
//!   The empty name is the default group used when no action exists.

#pragma once

#include "metadata/symbol.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace argschema::schema {

// ============================================================================
// Arguments
// ============================================================================

struct RequiredArgument {
    int position = 0;
    std::string name;
    std::string description;
    bool is_collection = false;
    const metadata::MemberSymbol* member = nullptr;
};

struct OptionalArgument {
    metadata::TypedConstant default_value;
    std::string name;
    std::string description;
    bool is_collection = false;
    const metadata::MemberSymbol* member = nullptr;
};

using Argument = std::variant<RequiredArgument, OptionalArgument>;

[[nodiscard]] auto argument_name(const Argument& arg) -> const std::string&;

[[nodiscard]] auto argument_member(const Argument& arg) -> const metadata::MemberSymbol*;

[[nodiscard]] inline auto is_required(const Argument& arg) -> bool {
    return std::holds_alternative<RequiredArgument>(arg);
}

/// The action member and the group names it legalizes.
struct ActionArgument {
    const metadata::MemberSymbol* member = nullptr;

    /// True when the member's declared type resolves to an enumeration.
    bool is_enum = false;

    /// Enumeration constant names, in declaration order. Empty unless
    /// `is_enum`.
    std::vector<std::string> group_names;
};

// ============================================================================
// GroupMap
// ============================================================================

class GroupMap {
public:
    struct Group {
        std::string name;
        std::vector<Argument> arguments;
    };

    /// Adds an empty group unless one with the same name (ignoring case)
    /// exists. Returns true if added.
    auto add_group(std::string_view name) -> bool;

    /// Returns the group's arguments, creating the group if needed.
    auto get_or_create(std::string_view name) -> std::vector<Argument>&;

    [[nodiscard]] auto find(std::string_view name) const -> const std::vector<Argument>*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return find(name) != nullptr;
    }

    /// Appends `arg` to every existing group.
    void append_to_all(const Argument& arg);

    /// Group names in insertion order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const -> size_t {
        return groups_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return groups_.empty();
    }

    [[nodiscard]] auto begin() const {
        return groups_.begin();
    }
    [[nodiscard]] auto end() const {
        return groups_.end();
    }

private:
    std::vector<Group> groups_;
    std::unordered_map<std::string, size_t> index_; // lowercased name -> groups_ index
};

} // namespace argschema::schema

//! # Schema Builder
//!
//! Turns a type's annotated members into an `ActionArgument` and a
//! `GroupMap`, reporting structural problems on the way.
//!
//! ## Phases
//!
//! ```text
//! build()
//!   ├─ locate_action()   first ActionMarker wins, later ones → ARG001
//!   ├─ seed_groups()     enum constants, or the single default group
//!   │                    (the group universe is fixed here)
//!   ├─ classify_member() per member, one exhaustive match over its markers
//!   │   └─ place()       common → every group, groups → named, else default
//!   └─ ARG002            action present but no group at all
//! ```

#pragma once

#include "schema/annotation.hpp"
#include "schema/argument.hpp"
#include "schema/reporter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace argschema::schema {

/// Result of building one type's schema.
struct SchemaModel {
    std::optional<ActionArgument> action;
    GroupMap groups;
};

/// What a member's annotations amount to, before placement.
struct Classification {
    enum class Kind {
        /// Required or optional marker found.
        Argument,
        /// Common or group marker without a required/optional marker.
        GroupWithoutArgument,
        /// None of the argument-shaping markers.
        NotAnArgument,
    };

    Kind kind = Kind::NotAnArgument;

    /// Built from the first required/optional marker. Set iff `kind ==
    /// Kind::Argument`.
    std::optional<Argument> argument;

    /// Required/optional markers after the first; each one is a conflict.
    size_t extra_markers = 0;

    bool is_common = false;

    /// Names from group markers, in order.
    std::vector<std::string> groups;
};

/// Classifies one member. Pure: reports nothing.
[[nodiscard]] auto classify_member(const AnnotatedMember& member) -> Classification;

class SchemaBuilder {
public:
    SchemaBuilder(const metadata::MetadataProvider& provider, DiagnosticReporter& reporter);

    [[nodiscard]] auto build(const std::vector<AnnotatedMember>& members) -> SchemaModel;

    /// Step 1. Reports ARG001 for every action marker after the first.
    [[nodiscard]] auto locate_action(const std::vector<AnnotatedMember>& members)
        -> std::optional<ActionArgument>;

    /// Step 2.
    [[nodiscard]] static auto seed_groups(const std::optional<ActionArgument>& action) -> GroupMap;

private:
    const metadata::MetadataProvider& provider_;
    DiagnosticReporter& reporter_;

    void place(const AnnotatedMember& member, const Classification& classification,
               SchemaModel& model);
};

} // namespace argschema::schema

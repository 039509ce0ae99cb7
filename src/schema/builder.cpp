#include "schema/builder.hpp"

#include "log/log.hpp"
#include "text/case_fold.hpp"

#include <string_view>
#include <type_traits>

namespace argschema::schema {

namespace {

auto make_argument(const RequiredMarker& marker, const metadata::MemberSymbol* member)
    -> Argument {
    return RequiredArgument{marker.position, marker.name, marker.description,
                            marker.is_collection, member};
}

auto make_argument(const OptionalMarker& marker, const metadata::MemberSymbol* member)
    -> Argument {
    return OptionalArgument{marker.default_value, marker.name, marker.description,
                            marker.is_collection, member};
}

auto is_declared(const ActionArgument& action, std::string_view group) -> bool {
    for (const auto& name : action.group_names) {
        if (text::equals_ignore_case(name, group)) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

auto classify_member(const AnnotatedMember& member) -> Classification {
    Classification result;

    for (const auto& annotation : member.annotations) {
        std::visit(
            [&](const auto& marker) {
                using T = std::decay_t<decltype(marker)>;
                if constexpr (std::is_same_v<T, RequiredMarker> ||
                              std::is_same_v<T, OptionalMarker>) {
                    if (result.argument) {
                        ++result.extra_markers;
                    } else {
                        result.argument = make_argument(marker, member.member);
                    }
                } else if constexpr (std::is_same_v<T, CommonMarker>) {
                    result.is_common = true;
                } else if constexpr (std::is_same_v<T, GroupMarker>) {
                    result.groups.push_back(marker.group_name);
                } else {
                    static_assert(std::is_same_v<T, ActionMarker>);
                }
            },
            annotation);
    }

    if (result.argument) {
        result.kind = Classification::Kind::Argument;
    } else if (result.is_common || !result.groups.empty()) {
        result.kind = Classification::Kind::GroupWithoutArgument;
    } else {
        result.kind = Classification::Kind::NotAnArgument;
    }
    return result;
}

// ============================================================================
// SchemaBuilder
// ============================================================================

SchemaBuilder::SchemaBuilder(const metadata::MetadataProvider& provider,
                             DiagnosticReporter& reporter)
    : provider_(provider), reporter_(reporter) {}

auto SchemaBuilder::build(const std::vector<AnnotatedMember>& members) -> SchemaModel {
    SchemaModel model;
    model.action = locate_action(members);
    model.groups = seed_groups(model.action);

    ARGSCHEMA_LOG_DEBUG("schema", "Seeded " << model.groups.size() << " group(s)"
                                            << (model.action ? " from action" : ""));

    for (const auto& annotated : members) {
        if (model.action && annotated.member == model.action->member) {
            continue;
        }

        auto classification = classify_member(annotated);
        const auto& member = *annotated.member;

        for (size_t i = 0; i < classification.extra_markers; ++i) {
            reporter_.report(RuleId::ConflictingPropertyDeclaration, member);
        }

        switch (classification.kind) {
        case Classification::Kind::NotAnArgument:
            ARGSCHEMA_LOG_TRACE("schema", "Ignoring " << member.name);
            break;
        case Classification::Kind::GroupWithoutArgument:
            reporter_.report(RuleId::CannotSpecifyAGroupForANonProperty, member);
            break;
        case Classification::Kind::Argument:
            place(annotated, classification, model);
            break;
        }
    }

    if (model.action && model.groups.empty()) {
        reporter_.report(RuleId::ActionWithoutArgumentsInGroup, *model.action->member);
    }

    return model;
}

auto SchemaBuilder::locate_action(const std::vector<AnnotatedMember>& members)
    -> std::optional<ActionArgument> {
    std::optional<ActionArgument> action;

    for (const auto& annotated : members) {
        if (!annotated.has<ActionMarker>()) {
            continue;
        }
        if (action) {
            reporter_.report(RuleId::DuplicateActionArgument, *annotated.member);
            continue;
        }

        ActionArgument found;
        found.member = annotated.member;

        // Methods have no value type to select a mode with.
        if (annotated.member->kind != metadata::MemberKind::Method) {
            const auto* type = provider_.declared_type_of(*annotated.member);
            if (type && type->is_enum()) {
                found.is_enum = true;
                found.group_names = type->enum_constants;
            }
        }

        ARGSCHEMA_LOG_DEBUG("schema", "Action member " << annotated.member->name
                                                       << (found.is_enum ? " (enum, " : " (")
                                                       << found.group_names.size()
                                                       << " group name(s))");
        action = std::move(found);
    }

    return action;
}

auto SchemaBuilder::seed_groups(const std::optional<ActionArgument>& action) -> GroupMap {
    GroupMap groups;
    if (!action) {
        groups.add_group("");
        return groups;
    }
    for (const auto& name : action->group_names) {
        groups.add_group(name);
    }
    return groups;
}

void SchemaBuilder::place(const AnnotatedMember& annotated, const Classification& classification,
                          SchemaModel& model) {
    const auto& member = *annotated.member;
    const auto& argument = *classification.argument;

    if (classification.is_common) {
        model.groups.append_to_all(argument);
        if (model.action && !model.action->is_enum) {
            reporter_.report(RuleId::CommonArgumentAttributeUsedWhenActionArgumentNotEnum,
                             member);
        }
        ARGSCHEMA_LOG_TRACE("schema", member.name << " -> all " << model.groups.size()
                                                  << " group(s)");
        return;
    }

    if (classification.groups.empty()) {
        model.groups.get_or_create("").push_back(argument);
        ARGSCHEMA_LOG_TRACE("schema", member.name << " -> default group");
        return;
    }

    const bool check_declared =
        reporter_.config().strict_groups && model.action && model.action->is_enum;

    for (const auto& group : classification.groups) {
        if (check_declared && !is_declared(*model.action, group)) {
            reporter_.report(RuleId::UndeclaredArgumentGroup, member, group);
        }
        model.groups.get_or_create(group).push_back(argument);
        ARGSCHEMA_LOG_TRACE("schema", member.name << " -> group '" << group << "'");
    }
}

} // namespace argschema::schema

#include "schema/diagnostic.hpp"

#include "text/case_fold.hpp"

#include <algorithm>

namespace argschema::schema {

// ============================================================================
// Rule Table
// ============================================================================

static const std::array<RuleDescriptor, RULE_COUNT> RULES = {{
    {RuleId::DuplicateActionArgument, "ARG001", "DuplicateActionArgument",
     "Only one action argument is allowed per type",
     "Another member of this type is already marked as the action argument", Severity::Error},
    {RuleId::ActionWithoutArgumentsInGroup, "ARG002", "ActionWithoutArgumentsInGroup",
     "Action argument without argument groups",
     "An action argument is declared but no argument groups were produced", Severity::Warning},
    {RuleId::ConflictingPropertyDeclaration, "ARG003", "ConflictingPropertyDeclaration",
     "Member declared as both required and optional",
     "A member cannot be both a required and an optional argument", Severity::Error},
    {RuleId::CannotSpecifyAGroupForANonProperty, "ARG004", "CannotSpecifyAGroupForANonProperty",
     "Group or common marker on a non-argument member",
     "Group and common markers require a required or optional argument marker", Severity::Error},
    {RuleId::CommonArgumentAttributeUsedWhenActionArgumentNotEnum, "ARG005",
     "CommonArgumentAttributeUsedWhenActionArgumentNotEnum",
     "Common argument without an enumeration action",
     "Common arguments need an action argument whose type is an enumeration", Severity::Warning},
    {RuleId::DuplicateArgumentName, "ARG006", "DuplicateArgumentName",
     "Argument name used more than once in a group",
     "The argument name '{0}' is already used in this group", Severity::Error},
    {RuleId::DuplicatePositionalArgumentPosition, "ARG007", "DuplicatePositionalArgumentPosition",
     "Positional slot used more than once in a group",
     "Position {0} is already used by another required argument in this group", Severity::Error},
    {RuleId::UndeclaredArgumentGroup, "ARG008", "UndeclaredArgumentGroup",
     "Argument group not declared by the action enumeration",
     "The group '{0}' is not a constant of the action argument's enumeration", Severity::Warning},
}};

auto all_rules() -> const std::array<RuleDescriptor, RULE_COUNT>& {
    return RULES;
}

auto rule_descriptor(RuleId id) -> const RuleDescriptor& {
    return RULES[static_cast<size_t>(id)];
}

auto find_rule(std::string_view code_or_name) -> std::optional<RuleId> {
    for (const auto& rule : RULES) {
        if (text::equals_ignore_case(code_or_name, rule.code) ||
            text::equals_ignore_case(code_or_name, rule.name)) {
            return rule.id;
        }
    }
    return std::nullopt;
}

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "unknown";
}

auto format_message(const RuleDescriptor& rule, const DiagnosticPayload& payload) -> std::string {
    std::string message = rule.message;
    size_t pos = message.find("{0}");
    if (pos == std::string::npos) {
        return message;
    }

    std::string value;
    if (auto* s = std::get_if<std::string>(&payload)) {
        value = *s;
    } else if (auto* i = std::get_if<int64_t>(&payload)) {
        value = std::to_string(*i);
    }
    message.replace(pos, 3, value);
    return message;
}

auto CollectingSink::count(RuleId rule) const -> size_t {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
                                             [rule](const Diagnostic& d) { return d.rule == rule; }));
}

} // namespace argschema::schema

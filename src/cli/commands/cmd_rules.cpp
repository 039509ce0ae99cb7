#include "cmd_rules.hpp"

#include "../diagnostic.hpp"
#include "schema/diagnostic.hpp"

#include <iomanip>
#include <iostream>
#include <unordered_map>

namespace argschema::cli {

namespace {

const std::unordered_map<schema::RuleId, const char*>& get_explanations() {
    static const std::unordered_map<schema::RuleId, const char*> explanations = {
        {schema::RuleId::DuplicateActionArgument, R"(
A type may have only one member marked with [ActionArgument]. The first one
in declaration order selects the active mode; later ones are reported and
otherwise treated as ordinary members.

    [ActionArgument] public Mode Action { get; set; }
    [ActionArgument] public Mode Other { get; set; }   // ARG001
)"},
        {schema::RuleId::ActionWithoutArgumentsInGroup, R"(
The type declares an action argument, but no argument group exists after
classification. This happens when the action's type is not an enumeration
and no member names a group with [ArgumentGroup].
)"},
        {schema::RuleId::ConflictingPropertyDeclaration, R"(
A member carries both a required-style and an optional-style marker. The
first marker wins; each further marker is reported once.

    [RequiredArgument(0, "path", "Input")]
    [OptionalArgument(null, "path", "Input")]   // ARG003
    public string Path { get; set; }
)"},
        {schema::RuleId::CannotSpecifyAGroupForANonProperty, R"(
[CommonArgument] and [ArgumentGroup] only place arguments into groups. On a
member without [RequiredArgument] or [OptionalArgument] they have nothing to
place, so the member contributes to no group.
)"},
        {schema::RuleId::CommonArgumentAttributeUsedWhenActionArgumentNotEnum, R"(
A common argument is added to every group legalized by the action
enumeration. When the action argument's type is not an enumeration there
are no such groups, and the common marker has no effect.
)"},
        {schema::RuleId::DuplicateArgumentName, R"(
Within one group every argument name must be unique. Names compare ignoring
case, so "Output" and "output" clash. The diagnostic is reported on the
later member.
)"},
        {schema::RuleId::DuplicatePositionalArgumentPosition, R"(
Within one group every required argument needs its own position. Two
required arguments at the same position in the same group are reported on
the later member.
)"},
        {schema::RuleId::UndeclaredArgumentGroup, R"(
Only reported with --strict-groups (or strict-groups = true). The member
names a group that is not a constant of the action argument's enumeration.
The group is still created, but no action value can select it.
)"},
    };
    return explanations;
}

} // namespace

int run_rules() {
    std::cout << std::left << std::setw(8) << "Code" << std::setw(10) << "Severity"
              << "Rule\n";
    for (const auto& rule : schema::all_rules()) {
        std::cout << std::setw(8) << rule.code << std::setw(10)
                  << schema::severity_name(rule.default_severity) << rule.name << "\n";
        std::cout << std::setw(18) << "" << rule.title << "\n";
    }
    std::cout << "\nRun `argschema rules <code>` for details.\n";
    return 0;
}

int run_explain(const std::string& code) {
    auto rule = schema::find_rule(code);
    if (!rule) {
        std::cerr << "Unknown rule `" << code << "`.\n";
        std::cerr << "Run `argschema rules` to list all rules.\n";
        return 1;
    }

    const auto& descriptor = schema::rule_descriptor(*rule);
    bool colors = terminal_supports_colors();
    if (colors) {
        std::cout << Colors::Bold << Colors::BrightCyan;
    }
    std::cout << descriptor.code << ": " << descriptor.name;
    if (colors) {
        std::cout << Colors::Reset;
    }
    std::cout << "\n" << descriptor.title << " (default: "
              << schema::severity_name(descriptor.default_severity) << ")\n";
    std::cout << get_explanations().at(*rule);
    return 0;
}

} // namespace argschema::cli

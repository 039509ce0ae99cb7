#include "schema/validator.hpp"

#include "log/log.hpp"
#include "text/case_fold.hpp"

#include <string>
#include <unordered_set>

namespace argschema::schema {

GroupValidator::GroupValidator(DiagnosticReporter& reporter) : reporter_(reporter) {}

void GroupValidator::validate(const GroupMap& groups) {
    for (const auto& group : groups) {
        validate_group(group.name, group.arguments);
    }
}

void GroupValidator::validate_group(std::string_view group_name,
                                    const std::vector<Argument>& arguments) {
    ARGSCHEMA_LOG_TRACE("validate", "Group '" << group_name << "': " << arguments.size()
                                              << " argument(s)");

    std::unordered_set<std::string> names; // case-folded
    std::unordered_set<int> positions;

    for (const auto& argument : arguments) {
        const auto& member = *argument_member(argument);
        const auto& name = argument_name(argument);
        auto key = text::fold_case(name);

        if (const auto* required = std::get_if<RequiredArgument>(&argument)) {
            if (positions.contains(required->position)) {
                reporter_.report(RuleId::DuplicatePositionalArgumentPosition, member,
                                 static_cast<int64_t>(required->position));
            }
            positions.insert(required->position);
        }

        if (names.contains(key)) {
            reporter_.report(RuleId::DuplicateArgumentName, member, name);
        }
        names.insert(std::move(key));
    }
}

} // namespace argschema::schema

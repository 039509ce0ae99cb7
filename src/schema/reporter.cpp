#include "schema/reporter.hpp"

#include "log/log.hpp"

namespace argschema::schema {

DiagnosticReporter::DiagnosticReporter(DiagnosticSink& sink, const AnalyzerConfig& config,
                                       std::string type_name)
    : sink_(sink), config_(config), type_name_(std::move(type_name)) {}

auto DiagnosticReporter::report(RuleId rule, const metadata::MemberSymbol& member,
                                DiagnosticPayload payload) -> bool {
    const auto& descriptor = rule_descriptor(rule);
    if (!config_.is_rule_enabled(rule)) {
        ARGSCHEMA_LOG_TRACE("schema", "Suppressed " << descriptor.code << " on " << type_name_
                                                    << "." << member.name);
        return false;
    }

    Diagnostic diag;
    diag.rule = rule;
    diag.severity = config_.severity_for(rule);
    diag.location = member.location;
    diag.type_name = type_name_;
    diag.member_name = member.name;
    diag.message = format_message(descriptor, payload);
    diag.payload = std::move(payload);

    switch (diag.severity) {
    case Severity::Error:
        ++errors_;
        break;
    case Severity::Warning:
        ++warnings_;
        break;
    case Severity::Info:
        ++infos_;
        break;
    }

    sink_.report(diag);
    return true;
}

} // namespace argschema::schema

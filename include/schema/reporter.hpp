//! # Diagnostic Reporter
//!
//! Per-type front end to a `DiagnosticSink`: fills in the rule message,
//! location and severity, drops disabled rules, and counts what it forwards.
//! One reporter is created for each analyzed type and never shared between
//! threads.

#pragma once

#include "metadata/symbol.hpp"
#include "schema/config.hpp"
#include "schema/diagnostic.hpp"

#include <string>

namespace argschema::schema {

class DiagnosticReporter {
public:
    DiagnosticReporter(DiagnosticSink& sink, const AnalyzerConfig& config, std::string type_name);

    /// Reports `rule` at `member`. Returns false if the rule is disabled.
    auto report(RuleId rule, const metadata::MemberSymbol& member,
                DiagnosticPayload payload = std::monostate{}) -> bool;

    [[nodiscard]] auto errors() const -> size_t {
        return errors_;
    }
    [[nodiscard]] auto warnings() const -> size_t {
        return warnings_;
    }
    [[nodiscard]] auto infos() const -> size_t {
        return infos_;
    }
    [[nodiscard]] auto total() const -> size_t {
        return errors_ + warnings_ + infos_;
    }

    [[nodiscard]] auto config() const -> const AnalyzerConfig& {
        return config_;
    }

private:
    DiagnosticSink& sink_;
    const AnalyzerConfig& config_;
    std::string type_name_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
    size_t infos_ = 0;
};

} // namespace argschema::schema

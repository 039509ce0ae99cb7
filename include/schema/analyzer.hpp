//! # Schema Analyzer
//!
//! Drives the pipeline for each type of a metadata provider:
//!
//! ```text
//! MetadataReader::read ──▶ entry gate ──▶ SchemaBuilder::build ──▶ GroupValidator::validate
//!                          (no recognized
//!                           attribute: skip)
//! ```
//!
//! Each type gets its own reporter, builder and validator, so types can be
//! analyzed on several threads at once. Only the sink is shared; in parallel
//! mode it is wrapped in a `SynchronizedSink`.

#pragma once

#include "metadata/symbol.hpp"
#include "schema/annotation.hpp"
#include "schema/argument.hpp"
#include "schema/config.hpp"
#include "schema/diagnostic.hpp"

#include <optional>

namespace argschema::schema {

/// Outcome of analyzing one type.
struct TypeAnalysis {
    const metadata::TypeSymbol* type = nullptr;

    /// True when the type carries no recognized attribute at all.
    bool skipped = false;

    std::optional<ActionArgument> action;
    GroupMap groups;

    size_t errors = 0;
    size_t warnings = 0;
    size_t infos = 0;

    [[nodiscard]] auto diagnostic_count() const -> size_t {
        return errors + warnings + infos;
    }
};

/// Totals over a whole provider.
struct AnalysisSummary {
    size_t types_seen = 0;
    size_t types_analyzed = 0;
    size_t errors = 0;
    size_t warnings = 0;
    size_t infos = 0;

    void merge(const TypeAnalysis& analysis) {
        ++types_seen;
        if (!analysis.skipped) {
            ++types_analyzed;
        }
        errors += analysis.errors;
        warnings += analysis.warnings;
        infos += analysis.infos;
    }

    void merge(const AnalysisSummary& other) {
        types_seen += other.types_seen;
        types_analyzed += other.types_analyzed;
        errors += other.errors;
        warnings += other.warnings;
        infos += other.infos;
    }
};

class SchemaAnalyzer {
public:
    SchemaAnalyzer(const metadata::MetadataProvider& provider, DiagnosticSink& sink,
                   AnalyzerConfig config = {});

    /// Analyzes one type, reporting to the analyzer's sink.
    [[nodiscard]] auto analyze_type(const metadata::TypeSymbol& type) const -> TypeAnalysis;

    /// Analyzes every type of the provider, on `config().jobs` threads.
    auto analyze_all() const -> AnalysisSummary;

    [[nodiscard]] auto config() const -> const AnalyzerConfig& {
        return config_;
    }

private:
    const metadata::MetadataProvider& provider_;
    DiagnosticSink& sink_;
    AnalyzerConfig config_;
    MetadataReader reader_;

    [[nodiscard]] auto analyze_type(const metadata::TypeSymbol& type, DiagnosticSink& sink) const
        -> TypeAnalysis;

    [[nodiscard]] auto worker_count(size_t type_count) const -> unsigned;
};

} // namespace argschema::schema

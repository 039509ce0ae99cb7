//! # Diagnostic Emitter
//!
//! Renders schema diagnostics for the terminal or for tools.
//!
//! ## Text Format
//!
//! ```text
//! error[ARG006]: The argument name 'output' is already used in this group
//!   --> Options.cs:14:9
//!      |
//!   14 |         [OptionalArgument(null, "output", "Output file")]
//!      |         ^
//!      |
//!   = note: in Options.Verbose
//! ```
//!
//! The source snippet is shown only when the declaring file is readable or
//! its content was registered with `set_source_content`.
//!
//! ## JSON Format
//!
//! One object per line:
//!
//! ```json
//! {"code":"ARG006","column":9,"file":"Options.cs","line":14,"member":"Verbose",
//!  "message":"...","payload":"output","rule":"DuplicateArgumentName",
//!  "severity":"error","type":"Options"}
//! ```

#pragma once

#include "schema/analyzer.hpp"
#include "schema/config.hpp"
#include "schema/diagnostic.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

namespace argschema::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Dim = "\033[2m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

/// True when stderr is a terminal that understands ANSI escapes.
bool terminal_supports_colors();

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter : public schema::DiagnosticSink {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_format(schema::OutputFormat format) {
        format_ = format;
    }

    /// Renders and counts warnings as errors.
    void set_warnings_as_errors(bool enabled) {
        warnings_as_errors_ = enabled;
    }

    /// Allows reading declaring source files from disk for snippets.
    void set_read_sources(bool enabled) {
        read_sources_ = enabled;
    }

    void set_source_content(const std::string& path, const std::string& content);

    void report(const schema::Diagnostic& diagnostic) override {
        emit(diagnostic);
    }

    void emit(const schema::Diagnostic& diagnostic);

    /// One-line totals. Text format only.
    void emit_summary(const schema::AnalysisSummary& summary, size_t files, size_t failed_files);

    /// Counts after `warnings_as_errors` is applied.
    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }
    [[nodiscard]] auto warning_count() const -> size_t {
        return warning_count_;
    }

    /// Severity as rendered, after `warnings_as_errors`.
    [[nodiscard]] auto effective_severity(schema::Severity severity) const -> schema::Severity;

private:
    std::ostream& out_;
    bool use_colors_ = false;
    bool warnings_as_errors_ = false;
    bool read_sources_ = false;
    schema::OutputFormat format_ = schema::OutputFormat::Text;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    // Keyed by path; nullopt caches an unreadable file.
    std::unordered_map<std::string, std::optional<std::string>> source_files_;

    [[nodiscard]] auto color(const char* code) const -> const char* {
        return use_colors_ ? code : "";
    }

    [[nodiscard]] auto severity_color(schema::Severity severity) const -> const char*;

    [[nodiscard]] auto get_source_line(const std::string& path, uint32_t line) -> std::string;

    void emit_text(const schema::Diagnostic& diagnostic, schema::Severity severity);
    void emit_json(const schema::Diagnostic& diagnostic, schema::Severity severity);
    void emit_source_snippet(const SourceLocation& location);
};

} // namespace argschema::cli

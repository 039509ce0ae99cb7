#include "diagnostic.hpp"

#include "json/json_value.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace argschema::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

auto DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) -> std::string {
    if (path.empty() || line == 0)
        return "";

    auto it = source_files_.find(path);
    if (it == source_files_.end()) {
        std::optional<std::string> content;
        if (read_sources_) {
            std::ifstream file(path);
            if (file) {
                std::stringstream buffer;
                buffer << file.rdbuf();
                content = buffer.str();
            }
        }
        it = source_files_.emplace(path, std::move(content)).first;
    }
    if (!it->second)
        return "";

    const std::string& content = *it->second;
    uint32_t current_line = 1;
    size_t line_start = 0;

    while (current_line < line) {
        size_t newline = content.find('\n', line_start);
        if (newline == std::string::npos)
            return "";
        line_start = newline + 1;
        ++current_line;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    std::string result = content.substr(line_start, line_end - line_start);
    if (!result.empty() && result.back() == '\r')
        result.pop_back();
    return result;
}

auto DiagnosticEmitter::effective_severity(schema::Severity severity) const -> schema::Severity {
    if (warnings_as_errors_ && severity == schema::Severity::Warning)
        return schema::Severity::Error;
    return severity;
}

auto DiagnosticEmitter::severity_color(schema::Severity severity) const -> const char* {
    switch (severity) {
    case schema::Severity::Error:
        return Colors::BrightRed;
    case schema::Severity::Warning:
        return Colors::BrightYellow;
    case schema::Severity::Info:
        return Colors::BrightCyan;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit(const schema::Diagnostic& diagnostic) {
    auto severity = effective_severity(diagnostic.severity);
    if (severity == schema::Severity::Error) {
        ++error_count_;
    } else if (severity == schema::Severity::Warning) {
        ++warning_count_;
    }

    if (format_ == schema::OutputFormat::JSON) {
        emit_json(diagnostic, severity);
        return;
    }
    emit_text(diagnostic, severity);
}

void DiagnosticEmitter::emit_text(const schema::Diagnostic& diagnostic, schema::Severity severity) {
    // Format: error[ARG006]: message
    out_ << color(Colors::Bold) << color(severity_color(severity))
         << schema::severity_name(severity) << "[" << diagnostic.code() << "]"
         << color(Colors::Reset) << color(Colors::Bold) << ": " << diagnostic.message
         << color(Colors::Reset) << "\n";

    emit_source_snippet(diagnostic.location);

    out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": in "
         << diagnostic.type_name << "." << diagnostic.member_name << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const SourceLocation& location) {
    if (!location.is_known())
        return;

    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << location.to_string()
         << "\n";

    std::string source_line = get_source_line(location.file, location.line);
    if (source_line.empty())
        return;

    int line_width = std::max(static_cast<int>(std::to_string(location.line).length()), 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
    out_ << color(Colors::BrightBlue) << std::setw(line_width) << location.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);
    uint32_t start_col = location.column > 0 ? location.column - 1 : 0;
    for (uint32_t i = 0; i < start_col && i < source_line.length(); ++i) {
        // Keep tabs so the caret lines up with the source.
        out_ << (source_line[i] == '\t' ? '\t' : ' ');
    }
    out_ << color(Colors::BrightRed) << "^" << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_json(const schema::Diagnostic& diagnostic, schema::Severity severity) {
    json::JsonValue obj(json::JsonObject{});
    obj.set("severity", schema::severity_name(severity));
    obj.set("code", diagnostic.code());
    obj.set("rule", schema::rule_descriptor(diagnostic.rule).name);
    obj.set("message", diagnostic.message);
    obj.set("type", diagnostic.type_name);
    obj.set("member", diagnostic.member_name);
    obj.set("file", diagnostic.location.file);
    obj.set("line", diagnostic.location.line);
    obj.set("column", diagnostic.location.column);

    if (auto name = diagnostic.payload_string()) {
        obj.set("payload", *name);
    } else if (auto position = diagnostic.payload_int()) {
        obj.set("payload", *position);
    }

    out_ << obj.to_string() << "\n";
}

void DiagnosticEmitter::emit_summary(const schema::AnalysisSummary& summary, size_t files,
                                     size_t failed_files) {
    if (format_ == schema::OutputFormat::JSON)
        return;

    const char* status_color = error_count_ > 0     ? Colors::BrightRed
                               : warning_count_ > 0 ? Colors::BrightYellow
                                                    : Colors::BrightGreen;

    out_ << color(Colors::Bold) << color(status_color) << "argschema" << color(Colors::Reset)
         << ": " << summary.types_analyzed << " of " << summary.types_seen
         << " type(s) analyzed in " << files << " file(s): " << error_count_ << " error(s), "
         << warning_count_ << " warning(s)";
    if (failed_files > 0) {
        out_ << ", " << failed_files << " file(s) failed to load";
    }
    out_ << "\n";
}

} // namespace argschema::cli

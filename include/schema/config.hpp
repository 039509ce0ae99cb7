//! # Analyzer Configuration
//!
//! Settings for the analyzer core and the CLI, loaded from `argschema.toml`.
//!
//! ## Configuration File
//!
//! ```toml
//! [analyzer]
//! namespace = "CommandLine"
//! strict-groups = false
//! jobs = 4
//! format = "text"
//! warnings-as-errors = false
//!
//! [analyzer.rules]
//! ARG002 = "off"     # disable a rule
//! ARG005 = "error"   # override its severity
//! ```
//!
//! Rules may be named by code or by rule name. A missing file yields the
//! defaults; malformed values are logged and ignored.

#pragma once

#include "schema/diagnostic.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>

namespace argschema::schema {

/// Settings consumed by the analyzer core.
struct AnalyzerConfig {
    /// Namespace whose attributes are recognized (compared ignoring case).
    std::string annotation_namespace = "CommandLine";

    /// Report group markers naming a group the action enumeration does not
    /// declare (ARG008). The group is still created.
    bool strict_groups = false;

    /// Worker threads for `SchemaAnalyzer::analyze_all`; 0 means one per core.
    unsigned jobs = 1;

    std::array<bool, RULE_COUNT> disabled_rules{};
    std::array<std::optional<Severity>, RULE_COUNT> severity_overrides{};

    [[nodiscard]] auto is_rule_enabled(RuleId rule) const -> bool {
        return !disabled_rules[static_cast<size_t>(rule)];
    }

    [[nodiscard]] auto severity_for(RuleId rule) const -> Severity {
        const auto& over = severity_overrides[static_cast<size_t>(rule)];
        return over ? *over : rule_descriptor(rule).default_severity;
    }

    void disable_rule(RuleId rule) {
        disabled_rules[static_cast<size_t>(rule)] = true;
    }

    void set_severity(RuleId rule, Severity severity) {
        disabled_rules[static_cast<size_t>(rule)] = false;
        severity_overrides[static_cast<size_t>(rule)] = severity;
    }
};

enum class OutputFormat { Text, JSON };

/// Analyzer settings plus CLI presentation settings.
struct ToolConfig {
    AnalyzerConfig analyzer;
    OutputFormat format = OutputFormat::Text;
    bool warnings_as_errors = false;
    bool colors = true;
};

/// File name looked up in the working directory.
constexpr const char* CONFIG_FILE_NAME = "argschema.toml";

/// Parses configuration text. Unknown keys and bad values are logged.
[[nodiscard]] auto parse_config(std::string_view text) -> ToolConfig;

/// Loads a configuration file; returns defaults if it does not exist.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> ToolConfig;

} // namespace argschema::schema

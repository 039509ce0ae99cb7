//! # Configuration Loading
//!
//! Line-oriented reader for the `[analyzer]` and `[analyzer.rules]` sections
//! of `argschema.toml`. Other sections are skipped so the file can be shared
//! with other tools.

#include "schema/config.hpp"

#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace argschema::schema {

namespace {

auto trim(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Strips a trailing `# comment` outside of quotes.
auto strip_comment(std::string_view s) -> std::string_view {
    bool in_quotes = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') {
            in_quotes = !in_quotes;
        } else if (s[i] == '#' && !in_quotes) {
            return s.substr(0, i);
        }
    }
    return s;
}

auto unquote(std::string_view s) -> std::string {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return std::string(s.substr(1, s.size() - 2));
    }
    return std::string(s);
}

auto parse_bool(std::string_view value, bool& out) -> bool {
    if (value == "true") {
        out = true;
        return true;
    }
    if (value == "false") {
        out = false;
        return true;
    }
    return false;
}

void apply_analyzer_key(ToolConfig& config, std::string_view key, std::string_view raw,
                        size_t line_no) {
    std::string value = unquote(raw);

    if (key == "namespace") {
        config.analyzer.annotation_namespace = value;
    } else if (key == "strict-groups") {
        if (!parse_bool(value, config.analyzer.strict_groups)) {
            ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": strict-groups expects a bool");
        }
    } else if (key == "warnings-as-errors") {
        if (!parse_bool(value, config.warnings_as_errors)) {
            ARGSCHEMA_LOG_WARN("config",
                               "line " << line_no << ": warnings-as-errors expects a bool");
        }
    } else if (key == "color") {
        if (!parse_bool(value, config.colors)) {
            ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": color expects a bool");
        }
    } else if (key == "jobs") {
        unsigned jobs = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": jobs expects a number");
        } else {
            config.analyzer.jobs = jobs;
        }
    } else if (key == "format") {
        if (value == "json") {
            config.format = OutputFormat::JSON;
        } else if (value == "text") {
            config.format = OutputFormat::Text;
        } else {
            ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": unknown format '" << value
                                                 << "'");
        }
    } else {
        ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": unknown key '" << key << "'");
    }
}

void apply_rule_key(ToolConfig& config, std::string_view key, std::string_view raw,
                    size_t line_no) {
    auto rule = find_rule(key);
    if (!rule) {
        ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": unknown rule '" << key << "'");
        return;
    }

    std::string value = unquote(raw);
    if (value == "off" || value == "false") {
        config.analyzer.disable_rule(*rule);
    } else if (value == "error") {
        config.analyzer.set_severity(*rule, Severity::Error);
    } else if (value == "warn" || value == "warning") {
        config.analyzer.set_severity(*rule, Severity::Warning);
    } else if (value == "info") {
        config.analyzer.set_severity(*rule, Severity::Info);
    } else if (value == "on" || value == "true") {
        config.analyzer.disabled_rules[static_cast<size_t>(*rule)] = false;
    } else {
        ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": unknown rule setting '" << value
                                             << "' for " << key);
    }
}

} // namespace

auto parse_config(std::string_view text) -> ToolConfig {
    ToolConfig config;

    enum class Section { Other, Analyzer, Rules };
    Section section = Section::Other;

    std::istringstream input{std::string(text)};
    std::string raw_line;
    size_t line_no = 0;

    while (std::getline(input, raw_line)) {
        ++line_no;
        std::string_view line = trim(strip_comment(raw_line));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line == "[analyzer]") {
                section = Section::Analyzer;
            } else if (line == "[analyzer.rules]") {
                section = Section::Rules;
            } else {
                section = Section::Other;
            }
            continue;
        }

        if (section == Section::Other) {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            ARGSCHEMA_LOG_WARN("config", "line " << line_no << ": expected key = value");
            continue;
        }
        std::string_view key = trim(line.substr(0, eq));
        std::string_view value = trim(line.substr(eq + 1));

        if (section == Section::Analyzer) {
            apply_analyzer_key(config, key, value, line_no);
        } else {
            apply_rule_key(config, key, value, line_no);
        }
    }

    return config;
}

auto load_config(const std::filesystem::path& path) -> ToolConfig {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ARGSCHEMA_LOG_DEBUG("config", "No config at " << path.string() << ", using defaults");
        return ToolConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        ARGSCHEMA_LOG_WARN("config", "Cannot read " << path.string() << ", using defaults");
        return ToolConfig{};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    ARGSCHEMA_LOG_DEBUG("config", "Loaded " << path.string());
    return parse_config(buffer.str());
}

} // namespace argschema::schema

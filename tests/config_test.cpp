//! # Configuration Tests

#include "schema/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace argschema;
using namespace argschema::schema;

TEST(ConfigTest, Defaults) {
    ToolConfig config;
    EXPECT_EQ(config.analyzer.annotation_namespace, "CommandLine");
    EXPECT_FALSE(config.analyzer.strict_groups);
    EXPECT_EQ(config.analyzer.jobs, 1u);
    EXPECT_EQ(config.format, OutputFormat::Text);
    EXPECT_FALSE(config.warnings_as_errors);

    for (const auto& rule : all_rules()) {
        EXPECT_TRUE(config.analyzer.is_rule_enabled(rule.id)) << rule.code;
        EXPECT_EQ(config.analyzer.severity_for(rule.id), rule.default_severity) << rule.code;
    }
}

TEST(ConfigTest, ParsesAnalyzerSection) {
    auto config = parse_config(R"(
[analyzer]
namespace = "Acme.Cli"   # attribute namespace
strict-groups = true
jobs = 8
format = "json"
warnings-as-errors = true
color = false
)");

    EXPECT_EQ(config.analyzer.annotation_namespace, "Acme.Cli");
    EXPECT_TRUE(config.analyzer.strict_groups);
    EXPECT_EQ(config.analyzer.jobs, 8u);
    EXPECT_EQ(config.format, OutputFormat::JSON);
    EXPECT_TRUE(config.warnings_as_errors);
    EXPECT_FALSE(config.colors);
}

TEST(ConfigTest, RuleSettingsByCodeOrName) {
    auto config = parse_config(R"(
[analyzer.rules]
ARG002 = "off"
CommonArgumentAttributeUsedWhenActionArgumentNotEnum = "error"
arg006 = "warn"
ARG007 = "info"
)");

    EXPECT_FALSE(config.analyzer.is_rule_enabled(RuleId::ActionWithoutArgumentsInGroup));
    EXPECT_EQ(config.analyzer.severity_for(RuleId::CommonArgumentAttributeUsedWhenActionArgumentNotEnum),
              Severity::Error);
    EXPECT_EQ(config.analyzer.severity_for(RuleId::DuplicateArgumentName), Severity::Warning);
    EXPECT_EQ(config.analyzer.severity_for(RuleId::DuplicatePositionalArgumentPosition),
              Severity::Info);
    EXPECT_TRUE(config.analyzer.is_rule_enabled(RuleId::DuplicateArgumentName));
}

TEST(ConfigTest, OtherSectionsAreIgnored) {
    auto config = parse_config(R"(
[package]
namespace = "Wrong"
jobs = 99

[analyzer]
jobs = 2

[lint]
strict-groups = true
)");

    EXPECT_EQ(config.analyzer.annotation_namespace, "CommandLine");
    EXPECT_EQ(config.analyzer.jobs, 2u);
    EXPECT_FALSE(config.analyzer.strict_groups);
}

TEST(ConfigTest, BadValuesKeepDefaults) {
    auto config = parse_config(R"(
[analyzer]
strict-groups = maybe
jobs = many
format = "xml"
unknown-key = 1
no equals sign here

[analyzer.rules]
ARG999 = "off"
ARG001 = "loud"
)");

    EXPECT_FALSE(config.analyzer.strict_groups);
    EXPECT_EQ(config.analyzer.jobs, 1u);
    EXPECT_EQ(config.format, OutputFormat::Text);
    EXPECT_TRUE(config.analyzer.is_rule_enabled(RuleId::DuplicateActionArgument));
    EXPECT_EQ(config.analyzer.severity_for(RuleId::DuplicateActionArgument), Severity::Error);
}

TEST(ConfigTest, HashInsideQuotesIsNotAComment) {
    auto config = parse_config("[analyzer]\nnamespace = \"A#B\" # trailing\n");
    EXPECT_EQ(config.analyzer.annotation_namespace, "A#B");
}

TEST(ConfigTest, SetSeverityReenablesRule) {
    AnalyzerConfig config;
    config.disable_rule(RuleId::DuplicateArgumentName);
    EXPECT_FALSE(config.is_rule_enabled(RuleId::DuplicateArgumentName));

    config.set_severity(RuleId::DuplicateArgumentName, Severity::Warning);
    EXPECT_TRUE(config.is_rule_enabled(RuleId::DuplicateArgumentName));
    EXPECT_EQ(config.severity_for(RuleId::DuplicateArgumentName), Severity::Warning);
}

TEST(ConfigTest, MissingFileYieldsDefaults) {
    auto config = load_config("/nonexistent/argschema/argschema.toml");
    EXPECT_EQ(config.analyzer.annotation_namespace, "CommandLine");
    EXPECT_EQ(config.analyzer.jobs, 1u);
}

TEST(ConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "argschema_config_test.toml";
    {
        std::ofstream out(path);
        out << "[analyzer]\nstrict-groups = true\n\n[analyzer.rules]\nARG005 = \"off\"\n";
    }

    auto config = load_config(path);
    EXPECT_TRUE(config.analyzer.strict_groups);
    EXPECT_FALSE(config.analyzer.is_rule_enabled(
        RuleId::CommonArgumentAttributeUsedWhenActionArgumentNotEnum));

    std::filesystem::remove(path);
}

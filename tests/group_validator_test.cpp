//! # Group Validator Tests
//!
//! Name and position uniqueness inside each group.

#include "schema/validator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace argschema;
using namespace argschema::schema;
using namespace argschema::test_support;

class GroupValidatorTest : public ::testing::Test {
protected:
    CollectingSink sink;
    AnalyzerConfig config;
    std::vector<Box<MemberSymbol>> members;

    auto member(const std::string& name) -> const MemberSymbol* {
        auto m = make_box<MemberSymbol>();
        m->name = name;
        m->location = SourceLocation{"Options.cs", static_cast<uint32_t>(10 + members.size()), 9};
        members.push_back(std::move(m));
        return members.back().get();
    }

    auto req(int position, const std::string& name) -> Argument {
        return RequiredArgument{position, name, "", false, member(name)};
    }

    auto opt(const std::string& name) -> Argument {
        return OptionalArgument{constant(nullptr), name, "", false, member(name)};
    }

    void validate(const GroupMap& groups) {
        DiagnosticReporter reporter(sink, config, "Options");
        GroupValidator validator(reporter);
        validator.validate(groups);
    }

    void validate(const std::vector<Argument>& arguments) {
        DiagnosticReporter reporter(sink, config, "Options");
        GroupValidator validator(reporter);
        validator.validate_group("", arguments);
    }
};

TEST_F(GroupValidatorTest, DistinctArgumentsPass) {
    validate({req(0, "input"), req(1, "output"), opt("verbose"), opt("force")});
    EXPECT_TRUE(sink.diagnostics().empty());
}

TEST_F(GroupValidatorTest, DuplicatePositionReportedOnceWithPosition) {
    validate({req(0, "input"), req(0, "output")});

    ASSERT_EQ(sink.diagnostics().size(), 1u);
    const auto& d = sink.diagnostics()[0];
    EXPECT_EQ(d.rule, RuleId::DuplicatePositionalArgumentPosition);
    EXPECT_EQ(d.payload_int().value_or(-1), 0);
    EXPECT_EQ(d.member_name, "output");
    EXPECT_EQ(d.message, "Position 0 is already used by another required argument in this group");
}

TEST_F(GroupValidatorTest, DuplicateNameIgnoresCaseAndCarriesLaterSpelling) {
    validate({req(0, "Output"), opt("output")});

    ASSERT_EQ(sink.diagnostics().size(), 1u);
    const auto& d = sink.diagnostics()[0];
    EXPECT_EQ(d.rule, RuleId::DuplicateArgumentName);
    EXPECT_EQ(d.payload_string().value_or(""), "output");
    EXPECT_EQ(d.location.line, 11u);
}

TEST_F(GroupValidatorTest, DuplicateNameBetweenOptionals) {
    validate({opt("verbose"), opt("VERBOSE"), opt("Verbose")});
    EXPECT_EQ(sink.count(RuleId::DuplicateArgumentName), 2u);
}

TEST_F(GroupValidatorTest, RequiredWithBothClashesReportsPositionFirst) {
    validate({req(0, "path"), req(0, "path")});

    ASSERT_EQ(sink.diagnostics().size(), 2u);
    EXPECT_EQ(sink.diagnostics()[0].rule, RuleId::DuplicatePositionalArgumentPosition);
    EXPECT_EQ(sink.diagnostics()[1].rule, RuleId::DuplicateArgumentName);
}

TEST_F(GroupValidatorTest, NameClashIgnoresNonAsciiCase) {
    validate({opt("Éx"), opt("éx")});

    ASSERT_EQ(sink.diagnostics().size(), 1u);
    EXPECT_EQ(sink.diagnostics()[0].rule, RuleId::DuplicateArgumentName);
    EXPECT_EQ(sink.diagnostics()[0].payload_string().value_or(""), "éx");
}

TEST_F(GroupValidatorTest, OptionalsHaveNoPosition) {
    // Optional arguments never occupy a positional slot.
    validate({opt("a"), req(0, "b"), opt("c")});
    EXPECT_TRUE(sink.diagnostics().empty());
}

TEST_F(GroupValidatorTest, GroupsAreCheckedIndependently) {
    GroupMap groups;
    auto shared = opt("verbose");
    groups.get_or_create("Start").push_back(req(0, "path"));
    groups.get_or_create("Start").push_back(shared);
    groups.get_or_create("Stop").push_back(req(0, "name"));
    groups.get_or_create("Stop").push_back(shared);

    validate(groups);
    EXPECT_TRUE(sink.diagnostics().empty());
}

TEST_F(GroupValidatorTest, SharedArgumentClashReportedPerGroup) {
    GroupMap groups;
    auto common_arg = opt("verbose");
    for (const char* name : {"Start", "Stop"}) {
        groups.get_or_create(name).push_back(opt("Verbose"));
        groups.get_or_create(name).push_back(common_arg);
    }

    validate(groups);
    EXPECT_EQ(sink.count(RuleId::DuplicateArgumentName), 2u);
}

TEST_F(GroupValidatorTest, DisabledRuleIsNotReported) {
    config.disable_rule(RuleId::DuplicatePositionalArgumentPosition);
    validate({req(0, "a"), req(0, "b")});
    EXPECT_TRUE(sink.diagnostics().empty());
}

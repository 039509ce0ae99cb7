//! # JSON Metadata Loader Tests

#include "metadata/json_loader.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace argschema;
using namespace argschema::metadata;

namespace {

auto load_ok(std::string_view text) -> MetadataStore {
    auto result = load_metadata_from_string(text, "test.json");
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : "");
    if (is_err(result)) {
        return MetadataStore{};
    }
    return std::move(unwrap(result));
}

auto load_error(std::string_view text) -> std::string {
    auto result = load_metadata_from_string(text, "test.json");
    EXPECT_TRUE(is_err(result));
    return is_err(result) ? unwrap_err(result) : "";
}

constexpr const char* OPTIONS_JSON = R"({
  "types": [
    { "name": "Mode", "kind": "enum", "constants": ["Start", "Stop"] },
    { "name": "Options", "file": "src/Options.cs", "line": 3,
      "members": [
        { "name": "Action", "type": "Mode", "line": 5, "column": 9,
          "attributes": [ { "namespace": "CommandLine", "name": "ActionArgument" } ] },
        { "name": "Path", "kind": "field", "type": "string", "line": 8,
          "attributes": [
            { "namespace": "CommandLine", "name": "RequiredArgument",
              "args": [0, "path", "The input path", true] } ] },
        { "name": "Ratio", "type": "double", "file": "src/Other.cs",
          "attributes": [
            { "namespace": "CommandLine", "name": "OptionalArgument",
              "args": [0.5, "ratio", null] } ] },
        { "name": "Run", "kind": "method" }
      ] }
  ]
})";

} // namespace

// ============================================================================
// Conversion
// ============================================================================

TEST(JsonLoaderTest, LoadsTypesInOrder) {
    auto store = load_ok(OPTIONS_JSON);

    auto types = store.types();
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0]->name, "Mode");
    EXPECT_EQ(types[1]->name, "Options");
}

TEST(JsonLoaderTest, EnumConstants) {
    auto store = load_ok(OPTIONS_JSON);

    const auto* mode = store.find_type("Mode");
    ASSERT_NE(mode, nullptr);
    EXPECT_TRUE(mode->is_enum());
    EXPECT_EQ(mode->enum_constants, (std::vector<std::string>{"Start", "Stop"}));
}

TEST(JsonLoaderTest, MembersAndLocations) {
    auto store = load_ok(OPTIONS_JSON);
    const auto* options = store.find_type("Options");
    ASSERT_NE(options, nullptr);
    EXPECT_EQ(options->kind, TypeKind::Class);
    ASSERT_EQ(options->members.size(), 4u);

    const auto& action = options->members[0];
    EXPECT_EQ(action.kind, MemberKind::Property);
    EXPECT_EQ(action.declared_type, "Mode");
    EXPECT_EQ(action.location, (SourceLocation{"src/Options.cs", 5, 9}));

    const auto& path = options->members[1];
    EXPECT_EQ(path.kind, MemberKind::Field);
    EXPECT_EQ(path.location, (SourceLocation{"src/Options.cs", 8, 0}));

    const auto& ratio = options->members[2];
    EXPECT_EQ(ratio.location, (SourceLocation{"src/Other.cs", 0, 0}));

    const auto& run = options->members[3];
    EXPECT_EQ(run.kind, MemberKind::Method);
    EXPECT_TRUE(run.declared_type.empty());
    EXPECT_TRUE(run.attributes.empty());
}

TEST(JsonLoaderTest, AttributeArgumentsKeepTheirKinds) {
    auto store = load_ok(OPTIONS_JSON);
    const auto* options = store.find_type("Options");
    ASSERT_NE(options, nullptr);

    const auto& required = options->members[1].attributes.at(0);
    EXPECT_EQ(required.namespace_name, "CommandLine");
    EXPECT_EQ(required.class_name, "RequiredArgument");
    ASSERT_EQ(required.constructor_args.size(), 4u);
    EXPECT_EQ(required.constructor_args[0], constant(0));
    EXPECT_EQ(required.constructor_args[1], constant("path"));
    EXPECT_EQ(required.constructor_args[3], constant(true));

    const auto& optional = options->members[2].attributes.at(0);
    ASSERT_EQ(optional.constructor_args.size(), 3u);
    EXPECT_EQ(optional.constructor_args[0], constant(0.5));
    EXPECT_TRUE(optional.constructor_args[2].is_null());
}

TEST(JsonLoaderTest, MemberAddressesAreStable) {
    auto store = load_ok(OPTIONS_JSON);
    const auto* before = &store.find_type("Options")->members[0];

    for (int i = 0; i < 64; ++i) {
        TypeSymbol extra;
        extra.name = "Extra" + std::to_string(i);
        store.add_type(std::move(extra));
    }

    EXPECT_EQ(&store.find_type("Options")->members[0], before);
}

TEST(JsonLoaderTest, EmptyTypeList) {
    auto store = load_ok(R"({"types": []})");
    EXPECT_EQ(store.size(), 0u);
}

// ============================================================================
// Errors
// ============================================================================

TEST(JsonLoaderTest, RootMustBeObject) {
    EXPECT_EQ(load_error("[]"), "test.json: document: root must be an object");
}

TEST(JsonLoaderTest, TypesMustBeArray) {
    EXPECT_EQ(load_error("{}"), "test.json: document: 'types' must be an array");
    EXPECT_EQ(load_error(R"({"types": {}})"), "test.json: document: 'types' must be an array");
}

TEST(JsonLoaderTest, TypeNeedsName) {
    EXPECT_EQ(load_error(R"({"types": [{"kind": "class"}]})"),
              "test.json: types[0]: type is missing 'name'");
}

TEST(JsonLoaderTest, MemberNeedsName) {
    EXPECT_EQ(load_error(R"({"types": [{"name": "T", "members": [{"type": "int"}]}]})"),
              "test.json: T.members[0]: member is missing 'name'");
}

TEST(JsonLoaderTest, AttributeNeedsName) {
    EXPECT_EQ(
        load_error(R"({"types": [{"name": "T", "members": [{"name": "M", "attributes": [{}]}]}]})"),
        "test.json: T.M: attribute is missing 'name'");
}

TEST(JsonLoaderTest, UnknownKinds) {
    EXPECT_EQ(load_error(R"({"types": [{"name": "T", "kind": "record"}]})"),
              "test.json: T: unknown type kind 'record'");
    EXPECT_EQ(load_error(R"({"types": [{"name": "T", "members": [{"name": "M", "kind": "event"}]}]})"),
              "test.json: T.M: unknown member kind 'event'");
}

TEST(JsonLoaderTest, NonLiteralAttributeArgument) {
    auto error = load_error(R"({"types": [{"name": "T", "members": [{"name": "M",
        "attributes": [{"name": "RequiredArgument", "args": [[0]]}]}]}]})");
    EXPECT_NE(error.find("attribute arguments must be literals"), std::string::npos);
}

TEST(JsonLoaderTest, NegativeLineIsRejected) {
    auto error = load_error(R"({"types": [{"name": "T", "line": -1}]})");
    EXPECT_EQ(error, "test.json: T: 'line' must be a non-negative integer");
}

TEST(JsonLoaderTest, ParseErrorsIncludeSourceAndPosition) {
    auto error = load_error("{\"types\": [}");
    EXPECT_EQ(error.rfind("test.json: line 1, column 12: ", 0), 0u);
}

// ============================================================================
// Files
// ============================================================================

TEST(JsonLoaderTest, MissingFile) {
    auto result = load_metadata_file("/nonexistent/argschema/options.json");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "cannot open /nonexistent/argschema/options.json");
}

TEST(JsonLoaderTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "argschema_loader_test.json";
    {
        std::ofstream out(path);
        out << OPTIONS_JSON;
    }

    auto result = load_metadata_file(path);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).size(), 2u);

    std::filesystem::remove(path);
}

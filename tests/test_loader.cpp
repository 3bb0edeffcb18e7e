/**
 * @file test_loader.cpp
 * @brief Tests for file loading and layered loading
 *
 * Tests cover:
 * - Java properties syntax
 * - JSON and TOML flattening
 * - Extension dispatch and missing files
 * - Candidate file lookup
 * - Layer precedence in load()
 */

#include <gtest/gtest.h>
#include "flatcfg/Accessors.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/ListDecoder.hpp"
#include "flatcfg/Loader.hpp"

#include "TestSupport.hpp"

using namespace flatcfg;
using namespace std::string_literals;
using flatcfg::test::EnvGuard;
using flatcfg::test::TempDir;

namespace fs = std::filesystem;

// ============================================================================
// Properties syntax
// ============================================================================

TEST(PropertiesText, SeparatorsAndComments) {
    auto props = parse_properties_text(
        "# comment\n"
        "! also a comment\n"
        "\n"
        "a=1\n"
        "b : two\n"
        "c three\n"
        "   d   =   spaced value  \n"
        "e=\n"
        "f\n");

    EXPECT_EQ(props.at("a"), Value{"1"s});
    EXPECT_EQ(props.at("b"), Value{"two"s});
    EXPECT_EQ(props.at("c"), Value{"three"s});
    EXPECT_EQ(props.at("d"), Value{"spaced value  "s});
    EXPECT_EQ(props.at("e"), Value{""s});
    EXPECT_EQ(props.at("f"), Value{""s});
    EXPECT_EQ(props.size(), 6u);
}

TEST(PropertiesText, OnlyFirstSeparatorConsumed) {
    auto props = parse_properties_text("url=http://h:80/x?a=b\nk==v\n");
    EXPECT_EQ(props.at("url"), Value{"http://h:80/x?a=b"s});
    EXPECT_EQ(props.at("k"), Value{"=v"s});
}

TEST(PropertiesText, LineContinuation) {
    auto props = parse_properties_text(
        "list = a, \\\n"
        "       b, \\\n"
        "       c\n"
        "next = 1\n");

    EXPECT_EQ(props.at("list"), Value{"a, b, c"s});
    EXPECT_EQ(props.at("next"), Value{"1"s});
}

TEST(PropertiesText, EscapedBackslashIsNotContinuation) {
    auto props = parse_properties_text("path = C:\\\\temp\\\\\nnext = 1\n");
    EXPECT_EQ(props.at("path"), Value{"C:\\temp\\"s});
    EXPECT_EQ(props.at("next"), Value{"1"s});
}

TEST(PropertiesText, Escapes) {
    auto props = parse_properties_text(
        "tab=a\\tb\n"
        "nl=a\\nb\n"
        "uni=caf\\u00e9\n"
        "emoji=\\uD83D\\uDE00\n"
        "key\\ with\\ spaces=v\n"
        "colon\\:key=w\n"
        "plain=\\q\n");

    EXPECT_EQ(props.at("tab"), Value{"a\tb"s});
    EXPECT_EQ(props.at("nl"), Value{"a\nb"s});
    EXPECT_EQ(props.at("uni"), Value{"caf\xC3\xA9"s});
    EXPECT_EQ(props.at("emoji"), Value{"\xF0\x9F\x98\x80"s});
    EXPECT_EQ(props.at("key with spaces"), Value{"v"s});
    EXPECT_EQ(props.at("colon:key"), Value{"w"s});
    EXPECT_EQ(props.at("plain"), Value{"q"s});
}

TEST(PropertiesText, MalformedUnicodeEscape) {
    try {
        parse_properties_text("a=1\nb=\\u12\n", "app.properties");
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), "app.properties");
        EXPECT_EQ(e.line(), 2);
    }
}

TEST(PropertiesText, LastDuplicateWins) {
    auto props = parse_properties_text("a=1\na=2\n");
    EXPECT_EQ(props.at("a"), Value{"2"s});
}

TEST(PropertiesText, CarriageReturnLineEndings) {
    auto props = parse_properties_text("a=1\r\nb=2\rc=3");
    EXPECT_EQ(props.size(), 3u);
    EXPECT_EQ(props.at("c"), Value{"3"s});
}

// ============================================================================
// JSON / TOML
// ============================================================================

TEST(FlattenJson, ObjectsAndArrays) {
    auto doc = nlohmann::json::parse(R"({
        "a": {"b": [{"c": 1}, {"c": 2}]},
        "flag": true,
        "ratio": 0.5,
        "name": "svc",
        "none": null,
        "empty": {},
        "tags": ["x", "y"]
    })");

    auto props = flatten_json(doc);
    EXPECT_EQ(props.at("a.b[0].c"), Value{std::int64_t{1}});
    EXPECT_EQ(props.at("a.b[1].c"), Value{std::int64_t{2}});
    EXPECT_EQ(props.at("flag"), Value{true});
    EXPECT_EQ(props.at("ratio"), Value{0.5});
    EXPECT_EQ(props.at("name"), Value{"svc"s});
    EXPECT_EQ(props.at("none"), Value{});
    EXPECT_EQ(props.at("tags[1]"), Value{"y"s});
    EXPECT_EQ(type_name(props.at("empty")), "object");
    EXPECT_EQ(props.size(), 9u);
}

TEST(FlattenJson, ListsDecodeBack) {
    auto props = flatten_json(nlohmann::json::parse(R"({"a": {"b": [{"c": 1}, {"c": 2}]}})"));
    auto entries = decode_list(props, "a.b");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].short_key(), "c");
}

TEST(FlattenJson, RootMustBeObject) {
    EXPECT_THROW(flatten_json(nlohmann::json::array()), InvalidArgumentError);
    EXPECT_TRUE(flatten_json(nlohmann::json::object()).empty());
}

TEST(LoadJsonFile, ParsesAndReportsErrors) {
    TempDir dir;
    auto good = dir.create_file("ok.json", R"({"server": {"port": 8080}})");
    auto bad = dir.create_file("bad.json", "{\n  \"a\": 1,\n  oops\n}");
    auto array = dir.create_file("array.json", "[1, 2]");

    EXPECT_EQ(get_required_port(load_json_file(good), "server.port"), 8080);

    try {
        load_json_file(bad);
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.line(), 3);
    }
    EXPECT_THROW(load_json_file(array), ConfigParseError);
    EXPECT_THROW(load_json_file(dir.path() / "none.json"), FileNotFoundError);
}

TEST(LoadTomlFile, TablesArraysAndDates) {
    TempDir dir;
    auto path = dir.create_file("app.toml",
        "title = \"demo\"\n"
        "[server]\n"
        "port = 8080\n"
        "ratio = 1.5\n"
        "[[workers]]\n"
        "host = \"w0\"\n"
        "[[workers]]\n"
        "host = \"w1\"\n"
        "[meta]\n"
        "released = 2024-01-02\n");

    auto props = load_toml_file(path);
    EXPECT_EQ(props.at("title"), Value{"demo"s});
    EXPECT_EQ(props.at("server.port"), Value{std::int64_t{8080}});
    EXPECT_EQ(props.at("server.ratio"), Value{1.5});
    EXPECT_EQ(props.at("workers[1].host"), Value{"w1"s});
    EXPECT_EQ(props.at("meta.released"), Value{"2024-01-02"s});
}

TEST(LoadTomlFile, SyntaxErrorHasLine) {
    TempDir dir;
    auto path = dir.create_file("bad.toml", "a = 1\nb = = 2\n");
    try {
        load_toml_file(path);
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.line(), 2);
    }
}

// ============================================================================
// Dispatch
// ============================================================================

TEST(LoadConfigFile, DispatchByExtension) {
    TempDir dir;
    auto props_file = dir.create_file("a.properties", "k=props\n");
    auto json_file = dir.create_file("a.JSON", R"({"k": "json"})");
    auto toml_file = dir.create_file("a.toml", "k = \"toml\"\n");
    auto yaml_file = dir.create_file("a.yaml", "k: yaml\n");

    EXPECT_EQ(load_config_file(props_file).at("k"), Value{"props"s});
    EXPECT_EQ(load_config_file(json_file).at("k"), Value{"json"s});
    EXPECT_EQ(load_config_file(toml_file).at("k"), Value{"toml"s});
    EXPECT_THROW(load_config_file(yaml_file), ConfigError);
    EXPECT_THROW(load_config_file(dir.path() / "absent.properties"), FileNotFoundError);
}

TEST(GetFileExtension, Lowercase) {
    EXPECT_EQ(get_file_extension("x/App.Properties"), ".properties");
    EXPECT_EQ(get_file_extension("noext"), "");
}

// ============================================================================
// Candidates
// ============================================================================

TEST(CandidateConfigFiles, TypicalLocations) {
    auto candidates = candidate_config_files();
    ASSERT_EQ(candidates.size(), 2u);

    fs::path cwd = fs::current_path();
    EXPECT_EQ(candidates[0].string(), (cwd / "application.properties").lexically_normal().string());
    EXPECT_EQ(candidates[1].string(),
              (cwd / "src/main/resources/application.properties").lexically_normal().string());
}

TEST(FirstExistingFile, PicksFirstThatExists) {
    TempDir dir;
    auto second = dir.create_file("second.properties", "");
    auto third = dir.create_file("third.properties", "");

    auto found = first_existing_file({dir.path() / "first.properties", second, third});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->string(), second.lexically_normal().string());

    EXPECT_FALSE(first_existing_file({dir.path() / "nope"}).has_value());
    EXPECT_THROW(first_existing_file({}), InvalidArgumentError);
}

// ============================================================================
// Layered loading
// ============================================================================

TEST(Load, PrecedenceDefaultsFileEnvOverrides) {
    TempDir dir;
    auto file = dir.create_file("app.properties",
        "a=file\n"
        "b=file\n"
        "c=file\n");

    EnvGuard env_b("FLATCFGTEST_B", "env");
    EnvGuard env_c("FLATCFGTEST_C", "env");

    LoadOptions options;
    options.defaults = {{"a", Value{"default"s}}, {"d", Value{"default"s}}};
    options.file_path = file;
    options.env_prefix = "FLATCFGTEST";
    options.overrides = {{"c", Value{"override"s}}};

    auto props = load(options);
    EXPECT_EQ(props.at("a"), Value{"file"s});
    EXPECT_EQ(props.at("b"), Value{"env"s});
    EXPECT_EQ(props.at("c"), Value{"override"s});
    EXPECT_EQ(props.at("d"), Value{"default"s});
}

TEST(Load, CandidatesWhenNoExplicitFile) {
    TempDir dir;
    auto file = dir.create_file("found.properties", "x=1\n");

    LoadOptions options;
    options.candidates = {dir.path() / "missing.properties", file};
    EXPECT_EQ(get_required_int(load(options), "x"), 1);

    options.candidates = {dir.path() / "missing.properties"};
    EXPECT_TRUE(load(options).empty());
}

TEST(Load, ExplicitMissingFileThrows) {
    LoadOptions options;
    options.file_path = fs::path("/nonexistent/flatcfg/app.properties");
    EXPECT_THROW(load(options), FileNotFoundError);
}

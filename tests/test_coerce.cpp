/**
 * @file test_coerce.cpp
 * @brief Unit tests for value coercion rules
 */

#include <gtest/gtest.h>
#include "flatcfg/Coerce.hpp"
#include "flatcfg/Errors.hpp"

#include <boost/uuid/uuid_io.hpp>

#include <cmath>
#include <exception>
#include <limits>

using namespace flatcfg;
using namespace std::string_literals;

namespace {

Value object_value() {
    return Value{std::in_place_type<nlohmann::json>, nlohmann::json{{"a", 1}}};
}

} // anonymous namespace

// ============================================================================
// Boolean
// ============================================================================

TEST(CoerceBool, TruthyStrings) {
    for (const auto& s : {"1"s, "on"s, "t"s, "true"s, "y"s, "yes"s, " YES "s, "True"s}) {
        EXPECT_EQ(coerce_bool(Value{s}, "k"), std::optional<bool>(true)) << s;
    }
}

TEST(CoerceBool, OtherStringsAreFalse) {
    for (const auto& s : {"0"s, "off"s, "false"s, "no"s, "2"s, "maybe"s}) {
        EXPECT_EQ(coerce_bool(Value{s}, "k"), std::optional<bool>(false)) << s;
    }
}

TEST(CoerceBool, AbsentValues) {
    EXPECT_FALSE(coerce_bool(Value{}, "k").has_value());
    EXPECT_FALSE(coerce_bool(Value{"   "s}, "k").has_value());
}

TEST(CoerceBool, Numbers) {
    EXPECT_EQ(coerce_bool(Value{std::int32_t{1}}, "k"), std::optional<bool>(true));
    EXPECT_EQ(coerce_bool(Value{std::int32_t{2}}, "k"), std::optional<bool>(false));
    EXPECT_EQ(coerce_bool(Value{std::int8_t{1}}, "k"), std::optional<bool>(true));
    EXPECT_EQ(coerce_bool(Value{std::int16_t{0}}, "k"), std::optional<bool>(false));
    EXPECT_EQ(coerce_bool(Value{1.9}, "k"), std::optional<bool>(true));
    EXPECT_EQ(coerce_bool(Value{0.99}, "k"), std::optional<bool>(false));
    EXPECT_EQ(coerce_bool(Value{std::nan("")}, "k"), std::optional<bool>(false));
    // 2^32 + 1 truncates to the int 1
    EXPECT_EQ(coerce_bool(Value{std::int64_t{4294967297LL}}, "k"), std::optional<bool>(true));
}

TEST(CoerceBool, BoolAndObject) {
    EXPECT_EQ(coerce_bool(Value{false}, "k"), std::optional<bool>(false));
    EXPECT_THROW(coerce_bool(object_value(), "k"), CoercionTypeError);
}

TEST(CoerceBool, TruthySetIsFixed) {
    const auto& values = truthy_values();
    EXPECT_EQ(values.size(), 6u);
    EXPECT_EQ(values.count("yes"), 1u);
    EXPECT_EQ(values.count("no"), 0u);
}

// ============================================================================
// Int / Long
// ============================================================================

TEST(CoerceInt, WidensNarrowTypes) {
    EXPECT_EQ(coerce_int(Value{std::int8_t{-5}}, "k"), std::optional<std::int32_t>(-5));
    EXPECT_EQ(coerce_int(Value{std::int16_t{300}}, "k"), std::optional<std::int32_t>(300));
    EXPECT_EQ(coerce_int(Value{std::int32_t{7}}, "k"), std::optional<std::int32_t>(7));
}

TEST(CoerceInt, LongMustFit) {
    EXPECT_EQ(coerce_int(Value{std::int64_t{2147483647}}, "k"),
              std::optional<std::int32_t>(2147483647));
    EXPECT_THROW(coerce_int(Value{std::int64_t{2147483648LL}}, "k"), NumericOverflowError);
    EXPECT_THROW(coerce_int(Value{std::int64_t{-2147483649LL}}, "k"), NumericOverflowError);
}

TEST(CoerceInt, Strings) {
    EXPECT_EQ(coerce_int(Value{" 42 "s}, "k"), std::optional<std::int32_t>(42));
    EXPECT_FALSE(coerce_int(Value{""s}, "k").has_value());
    EXPECT_THROW(coerce_int(Value{"4.2"s}, "k"), NumericParseError);
    EXPECT_THROW(coerce_int(Value{"9999999999"s}, "k"), NumericParseError);
}

TEST(CoerceInt, RejectedTypes) {
    EXPECT_THROW(coerce_int(Value{1.0}, "k"), CoercionTypeError);
    EXPECT_THROW(coerce_int(Value{true}, "k"), CoercionTypeError);
    EXPECT_THROW(coerce_int(object_value(), "k"), CoercionTypeError);
}

TEST(CoerceLong, AllIntegralTypes) {
    EXPECT_EQ(coerce_long(Value{std::int8_t{1}}, "k"), std::optional<std::int64_t>(1));
    EXPECT_EQ(coerce_long(Value{std::int64_t{9000000000LL}}, "k"),
              std::optional<std::int64_t>(9000000000LL));
    EXPECT_EQ(coerce_long(Value{"-9000000000"s}, "k"),
              std::optional<std::int64_t>(-9000000000LL));
    EXPECT_THROW(coerce_long(Value{2.5}, "k"), CoercionTypeError);
}

// ============================================================================
// String
// ============================================================================

TEST(CoerceString, TrimsAndFallsBack) {
    EXPECT_EQ(coerce_string(Value{"  hi  "s}, "k"), std::optional<std::string>("hi"));
    EXPECT_FALSE(coerce_string(Value{" "s}, "k").has_value());
    EXPECT_FALSE(coerce_string(Value{}, "k").has_value());
    EXPECT_EQ(coerce_string(Value{std::int32_t{8080}}, "k"), std::optional<std::string>("8080"));
    EXPECT_EQ(coerce_string(Value{true}, "k"), std::optional<std::string>("true"));
    EXPECT_EQ(coerce_string(object_value(), "k"), std::optional<std::string>("{\"a\":1}"));
}

// ============================================================================
// URI / Path / Regex / UUID
// ============================================================================

TEST(CoerceUri, StringsOnly) {
    auto uri = coerce_uri(Value{" http://h:1/x "s}, "k");
    ASSERT_TRUE(uri.has_value());
    EXPECT_EQ(uri->str(), "http://h:1/x");

    EXPECT_FALSE(coerce_uri(Value{""s}, "k").has_value());
    EXPECT_THROW(coerce_uri(Value{std::int32_t{1}}, "k"), CoercionTypeError);
    EXPECT_THROW(coerce_uri(Value{"http://h/a b"s}, "k"), UriParseError);
}

TEST(CoercePath, AbsoluteAndNormalized) {
    auto p = coerce_path(Value{"/tmp/a/../b/"s}, "k");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->string(), "/tmp/b");

    auto rel = coerce_path(Value{"x/y"s}, "k");
    ASSERT_TRUE(rel.has_value());
    EXPECT_TRUE(rel->is_absolute());
    EXPECT_EQ(rel->filename().string(), "y");

    EXPECT_THROW(coerce_path(Value{std::int32_t{1}}, "k"), CoercionTypeError);
}

TEST(CoerceRegex, CompilesOrReports) {
    auto re = coerce_regex(Value{"^a+b$"s}, "k");
    ASSERT_TRUE(re.has_value());
    EXPECT_TRUE(std::regex_match("aaab", *re));

    try {
        coerce_regex(Value{"(unclosed"s}, "filter.pattern");
        FAIL() << "expected PatternCompileError";
    } catch (const PatternCompileError& e) {
        EXPECT_EQ(e.key(), "filter.pattern");
        EXPECT_FALSE(e.cause().empty());
        EXPECT_THROW(std::rethrow_if_nested(e), std::regex_error);
    }
}

TEST(CoerceRegex, NonStringValuesUseTheirTextForm) {
    auto re = coerce_regex(Value{std::int32_t{42}}, "k");
    ASSERT_TRUE(re.has_value());
    EXPECT_TRUE(std::regex_match("42", *re));
    EXPECT_FALSE(std::regex_match("43", *re));
}

TEST(CoerceUuid, CanonicalFormOnly) {
    auto id = coerce_uuid(Value{"123e4567-e89b-12d3-a456-426614174000"s}, "k");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(boost::uuids::to_string(*id), "123e4567-e89b-12d3-a456-426614174000");

    auto upper = coerce_uuid(Value{"123E4567-E89B-12D3-A456-426614174000"s}, "k");
    EXPECT_EQ(*upper, *id);

    EXPECT_THROW(coerce_uuid(Value{"{123e4567-e89b-12d3-a456-426614174000}"s}, "k"),
                 UuidParseError);
    EXPECT_THROW(coerce_uuid(Value{"123e4567e89b12d3a456426614174000"s}, "k"), UuidParseError);
    EXPECT_THROW(coerce_uuid(Value{"not-a-uuid"s}, "k"), UuidParseError);
}

TEST(CoerceUuid, NonStringValueIsParseError) {
    EXPECT_THROW(coerce_uuid(Value{true}, "id"), UuidParseError);
    EXPECT_THROW(coerce_uuid(Value{std::int64_t{7}}, "id"), UuidParseError);
    EXPECT_FALSE(coerce_uuid(Value{}, "id").has_value());
}

// ============================================================================
// Port range
// ============================================================================

TEST(CheckPort, Bounds) {
    EXPECT_EQ(check_port("k", MIN_PORT), 0);
    EXPECT_EQ(check_port("k", MAX_PORT), 65535);
    EXPECT_THROW(check_port("k", -1), RangeError);
    EXPECT_THROW(check_port("k", 65536), RangeError);
}

TEST(CheckPort, MessageNamesValueAndBound) {
    try {
        check_port("server.port", 65536);
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("too high"), std::string::npos);
        EXPECT_NE(msg.find("65536"), std::string::npos);
        EXPECT_NE(msg.find("65535"), std::string::npos);
        EXPECT_NE(msg.find("server.port"), std::string::npos);
    }

    try {
        check_port("server.port", -1);
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("too low"), std::string::npos);
        EXPECT_NE(msg.find("-1"), std::string::npos);
    }
}

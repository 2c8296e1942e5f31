// VERISCORE - JSON Value Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include <gtest/gtest.h>

#include "veriscore/util/json.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace veriscore {
namespace util {
namespace {

TEST(JSONValueTest, Types) {
    EXPECT_TRUE(JSONValue().IsNull());
    EXPECT_TRUE(JSONValue(true).IsBool());
    EXPECT_TRUE(JSONValue(42).IsInt());
    EXPECT_TRUE(JSONValue(uint64_t{3}).IsInt());
    EXPECT_TRUE(JSONValue("groth16").IsString());
    EXPECT_TRUE(JSONValue(JSONValue::Array{}).IsArray());
    EXPECT_TRUE(JSONValue(JSONValue::Object{}).IsObject());
}

TEST(JSONValueTest, ObjectAccess) {
    JSONValue obj(JSONValue::Object{});
    obj["protocol"] = "groth16";
    obj["nPublic"] = 4;

    EXPECT_TRUE(obj.HasKey("protocol"));
    EXPECT_FALSE(obj.HasKey("curve"));
    EXPECT_EQ(obj["protocol"].GetString(), "groth16");
    EXPECT_EQ(obj["nPublic"].GetInt(), 4);

    const JSONValue& constObj = obj;
    EXPECT_TRUE(constObj["missing"].IsNull());
}

TEST(JSONValueTest, WrongTypeAccessorsReturnDefaults) {
    JSONValue value(7);
    EXPECT_EQ(value.GetString(), "");
    EXPECT_TRUE(value.GetArray().empty());
    EXPECT_FALSE(value.GetBool(false));
    EXPECT_EQ(JSONValue("x").GetInt(-1), -1);
}

TEST(JSONValueTest, FromStrings) {
    const JSONValue arr = JSONValue::FromStrings({"1", "2", "3"});
    ASSERT_EQ(arr.Size(), 3u);
    EXPECT_EQ(arr[0].GetString(), "1");
    EXPECT_EQ(arr[2].GetString(), "3");
}

TEST(JSONValueTest, CompactSerialization) {
    JSONValue obj(JSONValue::Object{});
    obj["b"] = JSONValue::FromStrings({"x", "y"});
    obj["a"] = true;
    EXPECT_EQ(obj.ToJSON(), R"({"a":true,"b":["x","y"]})");
}

TEST(JSONValueTest, PrettySerialization) {
    JSONValue obj(JSONValue::Object{});
    obj["a"] = 1;
    EXPECT_EQ(obj.ToJSON(true), "{\n  \"a\": 1\n}");
}

TEST(JSONValueTest, EscapesStrings) {
    JSONValue value(std::string("a\"b\\c\n"));
    EXPECT_EQ(value.ToJSON(), R"("a\"b\\c\n")");
}

TEST(JSONValueTest, ParseRoundTrip) {
    std::string text = R"({"curve":"bn128","pi_a":["1","2","1"],"n":-3,"ok":false,"z":null})";
    JSONValue parsed = JSONValue::Parse(text);

    EXPECT_EQ(parsed["curve"].GetString(), "bn128");
    ASSERT_EQ(parsed["pi_a"].Size(), 3u);
    EXPECT_EQ(parsed["pi_a"][1].GetString(), "2");
    EXPECT_EQ(parsed["n"].GetInt(), -3);
    EXPECT_FALSE(parsed["ok"].GetBool(true));
    EXPECT_TRUE(parsed["z"].IsNull());

    EXPECT_EQ(JSONValue::Parse(parsed.ToJSON()), parsed);
}

TEST(JSONValueTest, ParseEscapes) {
    auto parsed = JSONValue::TryParse(R"("A\u0042\/\u00e9")");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->GetString(), "AB/\xc3\xa9");
}

TEST(JSONValueTest, IntegersOnly) {
    EXPECT_EQ(JSONValue::Parse("[-9223372036854775808]")[size_t(0)].GetInt(),
              INT64_MIN);
    EXPECT_FALSE(JSONValue::TryParse("1.5").has_value());
    EXPECT_FALSE(JSONValue::TryParse("1e3").has_value());
    EXPECT_FALSE(JSONValue::TryParse("99999999999999999999").has_value());
    EXPECT_FALSE(JSONValue::TryParse("-").has_value());
}

TEST(JSONValueTest, ParseErrorReportsOffset) {
    try {
        JSONValue::Parse(R"({"protocol": "groth16", "curve" "bn128"})");
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.Offset(), 32u);
        EXPECT_NE(std::string(e.what()).find("expected ':'"), std::string::npos);
    }
}

TEST(JSONValueTest, NestingLimit) {
    const std::string deep(JSONValue::MAX_DEPTH + 1, '[');
    EXPECT_FALSE(JSONValue::TryParse(deep + std::string(JSONValue::MAX_DEPTH + 1, ']')).has_value());

    const std::string ok(JSONValue::MAX_DEPTH, '[');
    EXPECT_TRUE(JSONValue::TryParse(ok + std::string(JSONValue::MAX_DEPTH, ']')).has_value());
}

TEST(JSONValueTest, PrettyNestedArrays) {
    JSONValue point = JSONValue::FromStrings({"1", "2"});
    JSONValue::Array outer{point};
    EXPECT_EQ(JSONValue(outer).ToJSON(true), "[\n  [\n    \"1\",\n    \"2\"\n  ]\n]");
    EXPECT_EQ(JSONValue(JSONValue::Array{}).ToJSON(true), "[]");
}

TEST(JSONValueTest, PushConvertsToArray) {
    JSONValue value;
    value.Push(JSONValue("a"));
    value.Push(JSONValue(2));
    EXPECT_TRUE(value.IsArray());
    EXPECT_EQ(value.ToJSON(), R"(["a",2])");
}

TEST(JSONValueTest, TryParseRejectsMalformed) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse(R"({"a" 1})").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1,]").has_value());
    EXPECT_FALSE(JSONValue::TryParse(R"("unterminated)").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1] trailing").has_value());
}

TEST(JSONValueTest, ParseThrowsOnMalformed) {
    EXPECT_THROW(JSONValue::Parse("{bad}"), JSONParseError);
    EXPECT_THROW(JSONValue::Parse("{bad}"), std::runtime_error);
}

} // namespace
} // namespace util
} // namespace veriscore

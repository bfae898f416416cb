/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "convert_error.h"
#include "msgp/msgp_type_hint.h"

#include <gtest/gtest.h>

using namespace j2m::msgp;
using nlohmann::json;

TEST(TypeHintTest, ParsesEveryTagName) {
    const char* names[] = {"byte", "int8", "int16", "int32", "int64", "int", "uint8",
                           "uint16", "uint32", "uint64", "uint", "float32", "float64"};
    for (const char* name : names) {
        const auto tag = parse_type_tag(name);
        ASSERT_TRUE(tag.has_value()) << name;
        EXPECT_EQ(type_tag_name(*tag), name);
    }
    EXPECT_FALSE(parse_type_tag("INT64").has_value());
    EXPECT_FALSE(parse_type_tag("float").has_value());
    EXPECT_FALSE(parse_type_tag("").has_value());
}

TEST(TypeHintTest, FromJsonAcceptsStringOrArray) {
    const auto hints = type_hints_from_json(json::parse(R"({"": ["int64", "uint64"], "Fee": "uint8"})"));
    ASSERT_EQ(hints.size(), 2u);
    EXPECT_EQ(hints.at(""), (std::vector<std::string>{"int64", "uint64"}));
    EXPECT_EQ(hints.at("Fee"), (std::vector<std::string>{"uint8"}));
}

TEST(TypeHintTest, FromJsonKeepsUnknownTagsForLaterReporting) {
    const auto hints = type_hints_from_json(json::parse(R"({"a": ["decimal"]})"));
    EXPECT_EQ(hints.at("a").front(), "decimal");
}

TEST(TypeHintTest, FromJsonRejectsBadShapes) {
    EXPECT_THROW(type_hints_from_json(json::parse("[]")), j2m::ConvertError);
    EXPECT_THROW(type_hints_from_json(json::parse(R"({"a": []})")), j2m::ConvertError);
    EXPECT_THROW(type_hints_from_json(json::parse(R"({"a": 5})")), j2m::ConvertError);
    EXPECT_THROW(type_hints_from_json(json::parse(R"({"a": ["int8", 5]})")), j2m::ConvertError);
}

TEST(TypeHintTest, MergeOverridesByKey) {
    TypeHints base{{"a", {"int8"}}, {"b", {"uint8"}}};
    merge_type_hints(base, TypeHints{{"b", {"int64"}}, {"c", {"float64"}}});
    ASSERT_EQ(base.size(), 3u);
    EXPECT_EQ(base.at("a").front(), "int8");
    EXPECT_EQ(base.at("b").front(), "int64");
    EXPECT_EQ(base.at("c").front(), "float64");
}

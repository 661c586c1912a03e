// test_property_path.cpp - Canonical path keys and display helpers
//
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "refiner/refine/property_path.hpp"

namespace refiner
{

TEST(PropertyPath, StringifyMixesKeysAndIndices)
{
  const PropertyPath path{key_segment("items"), index_segment(0), key_segment("id")};
  EXPECT_EQ(stringify_property_path(path), R"(["items",0,"id"])");
  EXPECT_EQ(stringify_property_path({}), "[]");
}

TEST(PropertyPath, StringifyEscapesKeys)
{
  const PropertyPath path{key_segment("a\"b"), key_segment("line\nbreak")};
  EXPECT_EQ(stringify_property_path(path), R"(["a\"b","line\nbreak"])");
}

TEST(PropertyPath, KeyAndIndexOfSameTextDoNotCollide)
{
  EXPECT_NE(
    stringify_property_path({key_segment("1")}), stringify_property_path({index_segment(1)}));
}

TEST(PropertyPath, NonFiniteSegmentsNeverAliasFiniteOnes)
{
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  const auto nan_key = stringify_property_path({PathSegment(nan)});
  EXPECT_EQ(nan_key, R"(["NaN"])");
  EXPECT_NE(nan_key, stringify_property_path({PathSegment(0.0)}));
  EXPECT_NE(nan_key, "[null]");

  EXPECT_EQ(stringify_property_path({PathSegment(inf)}), R"(["Infinity"])");
  EXPECT_EQ(stringify_property_path({PathSegment(-inf)}), R"(["-Infinity"])");

  // Two NaN segments are the same logical slot.
  EXPECT_EQ(nan_key, stringify_property_path({PathSegment(nan)}));
}

TEST(PropertyPath, NegativeZeroCanonicalizesToZero)
{
  EXPECT_EQ(
    stringify_property_path({PathSegment(-0.0)}), stringify_property_path({PathSegment(0.0)}));
}

TEST(PropertyPath, ParseRoundTripsCanonicalKeys)
{
  const PropertyPath path{key_segment("a"), index_segment(2), key_segment("b")};
  const auto parsed = parse_property_path_key(stringify_property_path(path));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, path);
}

TEST(PropertyPath, ParseRejectsNonPaths)
{
  EXPECT_FALSE(parse_property_path_key("not json").has_value());
  EXPECT_FALSE(parse_property_path_key(R"({"a":1})").has_value());
  EXPECT_FALSE(parse_property_path_key("[true]").has_value());
  EXPECT_FALSE(parse_property_path_key(R"([["nested"]])").has_value());

  const auto empty = parse_property_path_key("[]");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(PropertyPath, JoinUsesJavaScriptSegmentText)
{
  const PropertyPath path{key_segment("items"), index_segment(1), key_segment("id")};
  EXPECT_EQ(join_property_path(path), "items.1.id");
  EXPECT_EQ(join_property_path(path, "/"), "items/1/id");
  EXPECT_EQ(join_property_path({}), "");
}

TEST(PropertyPath, FormatPathLabel)
{
  const PropertyPath path{key_segment("items"), index_segment(0), key_segment("title")};
  EXPECT_EQ(format_path_label("Card.props", path), "Card.props.items[0].title");
  EXPECT_EQ(format_path_label("Card.props", {}), "Card.props");
}

TEST(PropertyPath, PreservedKeyLookupUsesSegmentText)
{
  const PreservedKeySet keys{"children", "0"};
  EXPECT_TRUE(is_key_preserved(key_segment("children"), keys));
  EXPECT_TRUE(is_key_preserved(index_segment(0), keys));
  EXPECT_FALSE(is_key_preserved(key_segment("title"), keys));
  EXPECT_TRUE(is_key_preserved(std::string("children"), keys));
  EXPECT_FALSE(is_key_preserved(std::string("render"), keys));
}

}  // namespace refiner

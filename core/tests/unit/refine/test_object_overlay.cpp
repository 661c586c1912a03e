// test_object_overlay.cpp - Fixed-topology overlay merge
//
#include <gtest/gtest.h>

#include "refiner/refine/object_overlay.hpp"

namespace refiner
{

namespace
{

const PreservedKeySet k_children = {"children"};

}  // namespace

TEST(ObjectOverlay, KeepsKeysTheValidatorDropped)
{
  const Value base =
    Value::object_of({{"label", Value::make_string("x")}, {"extra", Value::make_string("y")}});
  const Value overlay = Value::object_of({{"label", Value::make_string("x")}});

  const Value merged = apply_overlay(base, overlay, k_children);
  EXPECT_EQ(to_display_string(merged), R"({"label":"x","extra":"y"})");
  EXPECT_EQ(merged.identity(), base.identity());
}

TEST(ObjectOverlay, TakesCoercedLeaves)
{
  const Value base = Value::object_of({{"count", Value::make_string("3")}});
  const Value overlay = Value::object_of({{"count", Value::make_number(3)}});

  const Value merged = apply_overlay(base, overlay, k_children);
  EXPECT_NE(merged.identity(), base.identity());
  EXPECT_EQ(to_display_string(merged), R"({"count":3})");
  // base is untouched
  EXPECT_EQ(to_display_string(base), R"({"count":"3"})");
}

TEST(ObjectOverlay, NeverAddsKeysMissingFromBase)
{
  const Value base = Value::object_of({{"a", Value::make_number(1)}});
  const Value overlay =
    Value::object_of({{"a", Value::make_number(1)}, {"size", Value::make_string("md")}});

  const Value merged = apply_overlay(base, overlay, k_children);
  EXPECT_EQ(to_display_string(merged), R"({"a":1})");
  EXPECT_EQ(merged.identity(), base.identity());
}

TEST(ObjectOverlay, PreservedKeysKeepBaseValue)
{
  const Value ref = Value::make_expression_ref({key_segment("children")});
  const Value base = Value::object_of({{"children", ref}});
  const Value overlay = Value::object_of({{"children", Value::make_string("replaced")}});

  const Value merged = apply_overlay(base, overlay, k_children);
  EXPECT_EQ(merged.identity(), base.identity());
  EXPECT_TRUE(merged.object()->find("children")->is_expression_ref());
}

TEST(ObjectOverlay, ArraysAreReplacedWholesale)
{
  const Value base = Value::object_of(
    {{"tags", Value::array_of({Value::make_string("a"), Value::make_string("b")})}});
  const Value new_tags = Value::array_of({Value::make_string("a")});
  const Value overlay = Value::object_of({{"tags", new_tags}});

  const Value merged = apply_overlay(base, overlay, k_children);
  EXPECT_EQ(merged.object()->find("tags")->identity(), new_tags.identity());
}

TEST(ObjectOverlay, SameArrayInstanceKeepsIdentity)
{
  const Value tags = Value::array_of({Value::make_number(1)});
  const Value base = Value::object_of({{"tags", tags}});
  const Value overlay = Value::object_of({{"tags", tags}});

  EXPECT_EQ(apply_overlay(base, overlay, k_children).identity(), base.identity());
}

TEST(ObjectOverlay, NestedObjectsMergeRecursively)
{
  const Value inner = Value::object_of(
    {{"w", Value::make_string("10")}, {"keep", Value::make_bool(true)}});
  const Value untouched = Value::object_of({{"z", Value::make_number(0)}});
  const Value base = Value::object_of({{"size", inner}, {"other", untouched}});
  const Value overlay = Value::object_of(
    {{"size", Value::object_of({{"w", Value::make_number(10)}})},
     {"other", Value::object_of({{"z", Value::make_number(0)}})}});

  const Value merged = apply_overlay(base, overlay, k_children);
  EXPECT_EQ(to_display_string(merged), R"({"size":{"w":10,"keep":true},"other":{"z":0}})");
  EXPECT_EQ(merged.object()->find("other")->identity(), untouched.identity());
  EXPECT_NE(merged.object()->find("size")->identity(), inner.identity());
}

TEST(ObjectOverlay, NonObjectArgumentsReturnBase)
{
  const Value base = Value::object_of({{"a", Value::make_number(1)}});
  EXPECT_EQ(apply_overlay(base, Value::make_null(), k_children).identity(), base.identity());

  const Value arr = Value::array_of({Value::make_number(1)});
  EXPECT_EQ(apply_overlay(arr, base, k_children).identity(), arr.identity());
}

}  // namespace refiner

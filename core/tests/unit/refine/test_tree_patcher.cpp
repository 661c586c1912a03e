// test_tree_patcher.cpp - In-place patching of object literal trees
//
#include <gtest/gtest.h>

#include "refiner/ast/expr_printer.hpp"
#include "refiner/refine/tree_patcher.hpp"
#include "refiner/test_support/parse_helpers.hpp"

namespace refiner
{

namespace
{

const PreservedKeySet k_children = {"children"};

PropertyPath path_of(std::initializer_list<PathSegment> segments) { return segments; }

class TreePatcherTest : public ::testing::Test
{
protected:
  /// Parse `src`, apply `patches` and return the result.
  ApplyPatchesResult run(
    const std::string & src, const std::vector<PropertyPatch> & patches,
    const PreservedKeySet & preserved = k_children)
  {
    parsed_ = test_support::parse_expr(src);
    EXPECT_NE(parsed_.expr, nullptr) << src;
    return apply_patches(parsed_.ast(), parsed_.expr, patches, preserved, {});
  }

  std::string text() const { return print_expr(parsed_.expr); }

  test_support::ParsedExpr parsed_;
};

}  // namespace

TEST_F(TreePatcherTest, SetReplacesExistingLeaf)
{
  const auto result =
    run("{count: '3', label: 'x'}",
        {PropertyPatch::set(path_of({key_segment("count")}), Value::make_number(3))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_FALSE(result.first_unapplied_path_key.has_value());
  EXPECT_EQ(text(), R"({count: 3, label: "x"})");
}

TEST_F(TreePatcherTest, SetOnMissingPathStaysUnapplied)
{
  const auto result =
    run("{a: 1}", {PropertyPatch::set(path_of({key_segment("size")}), Value::make_string("md"))});
  EXPECT_FALSE(result.fully_applied());
  EXPECT_EQ(result.remaining_set_count, 1u);
  EXPECT_EQ(result.first_unapplied_path_key, R"(["size"])");
  EXPECT_EQ(text(), "{a: 1}");
}

TEST_F(TreePatcherTest, DeleteRemovesProperty)
{
  const auto result =
    run("{a: 1, legacy: true, b: 2}", {PropertyPatch::remove(path_of({key_segment("legacy")}))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), "{a: 1, b: 2}");
}

TEST_F(TreePatcherTest, ArrayDeleteLeavesHoleAndSetFillsIt)
{
  const auto result =
    run("{xs: [1, , 3]}",
        {PropertyPatch::remove(path_of({key_segment("xs"), index_segment(2)})),
         PropertyPatch::set(path_of({key_segment("xs"), index_segment(1)}), Value::make_number(2))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), "{xs: [1, 2, ,]}");
}

TEST_F(TreePatcherTest, NestedAndQuotedKeys)
{
  const auto result =
    run("{size: {'w': '10', [\"h\"]: '5'}}",
        {PropertyPatch::set(path_of({key_segment("size"), key_segment("w")}), Value::make_number(10)),
         PropertyPatch::set(path_of({key_segment("size"), key_segment("h")}), Value::make_number(5))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), R"({size: {"w": 10, ["h"]: 5}})");
}

TEST_F(TreePatcherTest, ShorthandBecomesKeyValue)
{
  const auto result =
    run("{n}", {PropertyPatch::set(path_of({key_segment("n")}), Value::make_number(1))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), "{n: 1}");
}

TEST_F(TreePatcherTest, PreservedSubtreeIsNeverEntered)
{
  const auto result = run(
    "{children: {x: 1}}",
    {PropertyPatch::set(path_of({key_segment("children"), key_segment("x")}), Value::make_number(2))});
  EXPECT_EQ(result.remaining_set_count, 1u);
  EXPECT_EQ(text(), "{children: {x: 1}}");
}

TEST_F(TreePatcherTest, DynamicKeyIsUnaddressable)
{
  const auto result = run(
    "{[k]: {x: 1}}",
    {PropertyPatch::set(path_of({key_segment("k"), key_segment("x")}), Value::make_number(2))});
  EXPECT_EQ(result.remaining_set_count, 1u);
  EXPECT_EQ(text(), "{[k]: {x: 1}}");
}

TEST_F(TreePatcherTest, SpreadEntriesAreSkipped)
{
  const auto result = run(
    "{...base, a: '1'}",
    {PropertyPatch::set(path_of({key_segment("a")}), Value::make_number(1))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), "{...base, a: 1}");
}

TEST_F(TreePatcherTest, LastSetForAPathWins)
{
  const auto result =
    run("{a: 0}", {PropertyPatch::set(path_of({key_segment("a")}), Value::make_number(1)),
                   PropertyPatch::set(path_of({key_segment("a")}), Value::make_number(2))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), "{a: 2}");
}

TEST_F(TreePatcherTest, DuplicateKeysPatchOnlyTheFirstSlot)
{
  const auto result =
    run("{a: '1', a: '2'}", {PropertyPatch::set(path_of({key_segment("a")}), Value::make_number(3))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), R"({a: 3, a: "2"})");
}

TEST_F(TreePatcherTest, TraversalContinuesIntoReplacedValue)
{
  const auto result = run(
    "{box: 1}",
    {PropertyPatch::set(path_of({key_segment("box")}),
                        Value::object_of({{"w", Value::make_number(0)}})),
     PropertyPatch::set(path_of({key_segment("box"), key_segment("w")}), Value::make_number(9))});
  EXPECT_TRUE(result.fully_applied());
  EXPECT_EQ(text(), R"({box: {"w": 9}})");
}

TEST_F(TreePatcherTest, RemainingKeysKeepPatchOrder)
{
  const auto result =
    run("{}", {PropertyPatch::remove(path_of({key_segment("d")})),
               PropertyPatch::set(path_of({key_segment("b")}), Value::make_null()),
               PropertyPatch::set(path_of({key_segment("a")}), Value::make_null())});
  EXPECT_EQ(result.remaining_set_path_keys, (std::vector<std::string>{R"(["b"])", R"(["a"])"}));
  EXPECT_EQ(result.remaining_delete_path_keys, (std::vector<std::string>{R"(["d"])"}));
  EXPECT_EQ(result.first_unapplied_path_key, R"(["b"])");
}

TEST_F(TreePatcherTest, SecondRunIsANoOp)
{
  const std::vector<PropertyPatch> patches = {
    PropertyPatch::set(path_of({key_segment("a")}), Value::make_number(1))};
  ASSERT_TRUE(run("{a: '1'}", patches).fully_applied());
  const std::string once = text();

  ASSERT_TRUE(apply_patches(parsed_.ast(), parsed_.expr, patches, k_children, {}).fully_applied());
  EXPECT_EQ(text(), once);
}

TEST_F(TreePatcherTest, NonObjectRootAppliesNothing)
{
  const auto result =
    run("[1, 2]", {PropertyPatch::set(path_of({index_segment(0)}), Value::make_number(5))});
  EXPECT_EQ(result.remaining_set_count, 1u);
  EXPECT_EQ(text(), "[1, 2]");
}

}  // namespace refiner

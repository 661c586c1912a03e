// test_json_visitor.cpp - AST to JSON dump

#include <gtest/gtest.h>

#include "refiner/ast/ast_context.hpp"
#include "refiner/ast/json_visitor.hpp"
#include "refiner/test_support/parse_helpers.hpp"

namespace refiner
{

TEST(JsonVisitorTest, ProgramDump)
{
  auto unit = test_support::parse("jsx(Card, {a: [1, , 'x']});");
  ASSERT_FALSE(unit->diags.has_errors());

  const auto j = to_json(unit->program);
  EXPECT_EQ(j["type"], "Program");
  ASSERT_EQ(j["body"].size(), 1u);

  const auto & stmt = j["body"][0];
  EXPECT_EQ(stmt["type"], "ExprStmt");
  EXPECT_EQ(stmt["range"]["start"], 0);

  const auto & call = stmt["expr"];
  EXPECT_EQ(call["type"], "CallExpr");
  EXPECT_EQ(call["callee"]["name"], "jsx");
  EXPECT_FALSE(call["optional"].get<bool>());
  ASSERT_EQ(call["arguments"].size(), 2u);

  const auto & prop = call["arguments"][1]["properties"][0];
  EXPECT_EQ(prop["type"], "Property");
  EXPECT_EQ(prop["key"]["name"], "a");
  EXPECT_FALSE(prop["computed"].get<bool>());

  const auto & elements = prop["value"]["elements"];
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[0]["value"], 1.0);
  EXPECT_TRUE(elements[1].is_null());
  EXPECT_EQ(elements[2]["value"], "x");
}

TEST(JsonVisitorTest, SynthesizedRangesAreNull)
{
  AstContext ast;
  auto * id = ast.create<Identifier>(ast.intern("x"));
  const auto j = to_json(static_cast<const AstNode *>(id));
  EXPECT_EQ(j["type"], "Identifier");
  EXPECT_TRUE(j["range"]["start"].is_null());
}

TEST(JsonVisitorTest, OperatorsUseSourceSpelling)
{
  auto parsed = test_support::parse_expr("!a ?? b");
  const auto j = to_json(static_cast<const AstNode *>(parsed.expr));
  EXPECT_EQ(j["type"], "BinaryExpr");
  EXPECT_EQ(j["op"], "??");
  EXPECT_EQ(j["lhs"]["op"], "!");
}

TEST(JsonVisitorTest, NullNode)
{
  EXPECT_TRUE(to_json(static_cast<const AstNode *>(nullptr)).is_null());
}

}  // namespace refiner

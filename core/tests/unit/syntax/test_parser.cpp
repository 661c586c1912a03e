// test_parser.cpp - Recursive-descent parser for compiled modules

#include <gtest/gtest.h>

#include "refiner/test_support/parse_helpers.hpp"

namespace refiner
{

using test_support::parse;
using test_support::parse_expr;

namespace
{

bool has_error_containing(const DiagnosticBag & diags, std::string_view needle)
{
  for (const auto & d : diags) {
    if (d.severity == Severity::Error && d.message.find(needle) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

TEST(ParserTest, CompiledMdxModuleShape)
{
  auto unit = parse(
    "import {jsx as _jsx, jsxs as _jsxs} from \"react/jsx-runtime\";\n"
    "export const meta = {title: \"Hello\"};\n"
    "function _createMdxContent(props) {\n"
    "  const _components = {p: \"p\", ...props.components};\n"
    "  if (!_components.Card) _missingMdxReference(\"Card\", true);\n"
    "  return _jsxs(_components.Card, {count: 3, children: [_jsx(_components.p, {children: \"x\"})]});\n"
    "}\n"
    "export default function MDXContent(props = {}) {\n"
    "  const {wrapper: MDXLayout} = props.components || {};\n"
    "  return MDXLayout ? _jsx(MDXLayout, {...props, children: _jsx(_createMdxContent, {...props})}) "
    ": _createMdxContent(props);\n"
    "}\n");

  ASSERT_FALSE(unit->diags.has_errors());
  ASSERT_NE(unit->program, nullptr);
  ASSERT_EQ(unit->program->body.size(), 4u);
  EXPECT_TRUE(isa<RawStmt>(unit->program->body[0]));

  auto * meta = dyn_cast<VarDecl>(unit->program->body[1]);
  ASSERT_NE(meta, nullptr);
  EXPECT_TRUE(meta->exported);
  EXPECT_EQ(meta->var_kind, VarKind::Const);

  auto * content = dyn_cast<FunctionDecl>(unit->program->body[2]);
  ASSERT_NE(content, nullptr);
  EXPECT_EQ(content->name, "_createMdxContent");
  ASSERT_EQ(content->body->body.size(), 3u);

  auto * mdx = dyn_cast<FunctionDecl>(unit->program->body[3]);
  ASSERT_NE(mdx, nullptr);
  EXPECT_TRUE(mdx->exported);
  EXPECT_TRUE(mdx->is_default);

  EXPECT_EQ(test_support::collect_calls(unit->program).size(), 6u);
}

TEST(ParserTest, ObjectLiteralForms)
{
  auto parsed = parse_expr("{a: 1, 'b': 2, [c]: 3, 4: x, d, ...e, true: 5}");
  ASSERT_FALSE(parsed.unit->diags.has_errors());
  auto * obj = dyn_cast<ObjectExpr>(parsed.expr);
  ASSERT_NE(obj, nullptr);
  ASSERT_EQ(obj->properties.size(), 7u);

  auto prop = [&](size_t i) { return dyn_cast<Property>(obj->properties[i]); };
  EXPECT_TRUE(isa<Identifier>(prop(0)->key));
  EXPECT_TRUE(isa<StringLiteral>(prop(1)->key));
  EXPECT_TRUE(prop(2)->computed);
  EXPECT_TRUE(isa<NumberLiteral>(prop(3)->key));
  EXPECT_TRUE(prop(4)->shorthand);
  EXPECT_TRUE(isa<SpreadElement>(obj->properties[5]));
  ASSERT_NE(prop(6), nullptr);
  EXPECT_TRUE(isa<Identifier>(prop(6)->key));
}

TEST(ParserTest, ArrayHolesAndTrailingComma)
{
  auto parsed = parse_expr("[1, , 3, ]");
  auto * arr = dyn_cast<ArrayExpr>(parsed.expr);
  ASSERT_NE(arr, nullptr);
  ASSERT_EQ(arr->elements.size(), 3u);
  EXPECT_EQ(arr->elements[1], nullptr);

  auto trailing = parse_expr("[1, ,]");
  auto * arr2 = dyn_cast<ArrayExpr>(trailing.expr);
  ASSERT_NE(arr2, nullptr);
  ASSERT_EQ(arr2->elements.size(), 2u);
  EXPECT_EQ(arr2->elements[1], nullptr);
}

TEST(ParserTest, LiteralValues)
{
  auto num = parse_expr("0x10");
  ASSERT_TRUE(isa<NumberLiteral>(num.expr));
  EXPECT_EQ(cast<NumberLiteral>(num.expr)->value, 16);

  auto sep = parse_expr("1_000.5");
  EXPECT_EQ(cast<NumberLiteral>(sep.expr)->value, 1000.5);

  auto big = parse_expr("0x1Fn");
  ASSERT_TRUE(isa<BigIntLiteral>(big.expr));
  EXPECT_EQ(cast<BigIntLiteral>(big.expr)->digits, "31");

  auto str = parse_expr(R"('a\nbA\x42')");
  ASSERT_TRUE(isa<StringLiteral>(str.expr));
  EXPECT_EQ(cast<StringLiteral>(str.expr)->value, "a\nbAB");

  auto re = parse_expr("/a+/g");
  ASSERT_TRUE(isa<RegExpLiteral>(re.expr));
  EXPECT_EQ(cast<RegExpLiteral>(re.expr)->pattern, "a+");
  EXPECT_EQ(cast<RegExpLiteral>(re.expr)->flags, "g");

  auto tpl = parse_expr("`a${1}b`");
  auto * tl = dyn_cast<TemplateLiteral>(tpl.expr);
  ASSERT_NE(tl, nullptr);
  EXPECT_EQ(tl->quasis.size(), 2u);
  EXPECT_EQ(tl->expressions.size(), 1u);
}

TEST(ParserTest, OperatorPrecedence)
{
  auto parsed = parse_expr("a || b && c + d * -e");
  auto * orx = dyn_cast<BinaryExpr>(parsed.expr);
  ASSERT_NE(orx, nullptr);
  EXPECT_EQ(orx->op, BinaryOp::Or);
  auto * andx = dyn_cast<BinaryExpr>(orx->rhs);
  ASSERT_NE(andx, nullptr);
  EXPECT_EQ(andx->op, BinaryOp::And);
  auto * add = dyn_cast<BinaryExpr>(andx->rhs);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);
  auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_TRUE(isa<UnaryExpr>(mul->rhs));
}

TEST(ParserTest, MemberAndCallChains)
{
  auto parsed = parse_expr("a?.b[c](1)?.(2)");
  auto * outer = dyn_cast<CallExpr>(parsed.expr);
  ASSERT_NE(outer, nullptr);
  EXPECT_TRUE(outer->optional);
  auto * inner = dyn_cast<CallExpr>(outer->callee);
  ASSERT_NE(inner, nullptr);
  auto * computed = dyn_cast<MemberExpr>(inner->callee);
  ASSERT_NE(computed, nullptr);
  EXPECT_TRUE(computed->computed);
  auto * opt = dyn_cast<MemberExpr>(computed->object);
  ASSERT_NE(opt, nullptr);
  EXPECT_TRUE(opt->optional);
}

TEST(ParserTest, ArrowFunctions)
{
  auto expr_body = parse_expr("(x, {y}) => ({x, y})");
  auto * fn = dyn_cast<ArrowFunctionExpr>(expr_body.expr);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->params.size(), 2u);
  EXPECT_TRUE(isa<ObjectExpr>(fn->expr_body));

  auto block_body = parse_expr("async x => { return x; }");
  auto * fn2 = dyn_cast<ArrowFunctionExpr>(block_body.expr);
  ASSERT_NE(fn2, nullptr);
  EXPECT_TRUE(fn2->is_async);
  ASSERT_NE(fn2->block_body, nullptr);
}

TEST(ParserTest, AutomaticSemicolonInsertion)
{
  auto unit = parse("const a = 1\nconst b = a\nb");
  ASSERT_FALSE(unit->diags.has_errors());
  EXPECT_EQ(unit->program->body.size(), 3u);
}

TEST(ParserTest, UnsupportedConstructsAreReported)
{
  EXPECT_TRUE(has_error_containing(parse("for (;;) {}")->diags, "unsupported statement 'for'"));
  EXPECT_TRUE(has_error_containing(parse("x++;")->diags, "update expressions"));
  EXPECT_TRUE(has_error_containing(parse("({m() {}});")->diags, "object methods"));
  EXPECT_TRUE(has_error_containing(parse("const a;")->diags, "missing initializer"));
  EXPECT_TRUE(has_error_containing(parse("f(function () {});")->diags, "arrow function"));
}

TEST(ParserTest, RecoversAfterErrors)
{
  auto unit = parse("const a = ;\nconst b = 2;\n");
  EXPECT_TRUE(unit->diags.has_errors());
  ASSERT_NE(unit->program, nullptr);

  bool saw_b = false;
  for (const auto * s : unit->program->body) {
    if (const auto * vd = dyn_cast<VarDecl>(s)) {
      for (const auto * d : vd->declarators) {
        if (const auto * id = dyn_cast<Identifier>(d->target)) saw_b |= id->name == "b";
      }
    }
  }
  EXPECT_TRUE(saw_b);
}

TEST(ParserTest, RangesPointIntoSource)
{
  auto unit = parse("  jsx(Card, {a: 1});");
  const auto calls = test_support::collect_calls(unit->program);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(unit->source.get_slice(calls[0]->get_range()), "jsx(Card, {a: 1})");
}

}  // namespace refiner

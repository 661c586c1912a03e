// test_expr_printer.cpp - Regenerating source text from the tree

#include <gtest/gtest.h>

#include "refiner/ast/expr_printer.hpp"
#include "refiner/test_support/parse_helpers.hpp"

namespace refiner
{

namespace
{

std::string reprint_expr(const std::string & src)
{
  auto parsed = test_support::parse_expr(src);
  EXPECT_FALSE(parsed.unit->diags.has_errors()) << src;
  return print_expr(parsed.expr);
}

std::string reprint_program(const std::string & src)
{
  auto unit = test_support::parse(src);
  EXPECT_FALSE(unit->diags.has_errors()) << src;
  return print_program(unit->program);
}

}  // namespace

TEST(ExprPrinterTest, LiteralsAreNormalized)
{
  EXPECT_EQ(reprint_expr("'single'"), R"("single")");
  EXPECT_EQ(reprint_expr("0x10"), "16");
  EXPECT_EQ(reprint_expr("1_000"), "1000");
  EXPECT_EQ(reprint_expr("1e21"), "1e+21");
  EXPECT_EQ(reprint_expr("0x1Fn"), "31n");
  EXPECT_EQ(reprint_expr("/a+/gi"), "/a+/gi");
  EXPECT_EQ(reprint_expr("`a${b}c`"), "`a${b}c`");
}

TEST(ExprPrinterTest, LoneSurrogateEscapesSurvive)
{
  EXPECT_EQ(reprint_expr(R"('\uD800')"), R"("\ud800")");
  EXPECT_EQ(reprint_expr(R"("a\uDFFFb")"), R"("a\udfffb")");
  EXPECT_EQ(reprint_program(R"(f({t: "\uD800"});)"), "f({t: \"\\ud800\"});\n");
  // A complete pair decodes to one code point
  EXPECT_EQ(reprint_expr(R"('\uD83D\uDE00')"), "\"\xF0\x9F\x98\x80\"");
}

TEST(ExprPrinterTest, ObjectsAndArrays)
{
  EXPECT_EQ(reprint_expr("{a:1,'b':2,[c]:3,d,...e}"), R"({a: 1, "b": 2, [c]: 3, d, ...e})");
  EXPECT_EQ(reprint_expr("{}"), "{}");
  EXPECT_EQ(reprint_expr("[1,,3]"), "[1, , 3]");
  EXPECT_EQ(reprint_expr("[1,,]"), "[1, ,]");
  EXPECT_EQ(reprint_expr("[1,2,]"), "[1, 2]");
}

TEST(ExprPrinterTest, ParenthesesFollowPrecedence)
{
  EXPECT_EQ(reprint_expr("(a + b) * c"), "(a + b) * c");
  EXPECT_EQ(reprint_expr("a + (b * c)"), "a + b * c");
  EXPECT_EQ(reprint_expr("a - (b - c)"), "a - (b - c)");
  EXPECT_EQ(reprint_expr("(a ** b) ** c"), "(a ** b) ** c");
  EXPECT_EQ(reprint_expr("a ?? (b || c)"), "a ?? (b || c)");
  EXPECT_EQ(reprint_expr("-(-a)"), "-(-a)");
  EXPECT_EQ(reprint_expr("(a, b) => ({a})"), "(a, b) => ({a})");
  EXPECT_EQ(reprint_expr("new (f())()"), "new (f())()");
  EXPECT_EQ(reprint_expr("(1).toFixed(2)"), "(1).toFixed(2)");
  EXPECT_EQ(reprint_expr("typeof x === 'string' ? a : b"), R"(typeof x === "string" ? a : b)");
}

TEST(ExprPrinterTest, CallsAndMembers)
{
  EXPECT_EQ(reprint_expr("a?.b?.[c]?.(d)"), "a?.b?.[c]?.(d)");
  EXPECT_EQ(reprint_expr("_jsx(_components.Card, {children: 'x'})"),
            R"(_jsx(_components.Card, {children: "x"}))");
}

TEST(ExprPrinterTest, ProgramStatements)
{
  const std::string src =
    "import {jsx as _jsx} from \"react/jsx-runtime\";\n"
    "export const a = 1, b = [2];\n"
    "function f(x, y = 2) {\n"
    "  if (x) {\n"
    "    return x;\n"
    "  } else return y;\n"
    "}\n"
    "export default function MDXContent(props = {}) {\n"
    "  throw new Error(\"no\");\n"
    "}\n";
  EXPECT_EQ(reprint_program(src), src);
}

TEST(ExprPrinterTest, ObjectStatementIsWrapped)
{
  EXPECT_EQ(reprint_program("({a} = b);"), "({a} = b);\n");
}

TEST(ExprPrinterTest, RawStatementsAreVerbatim)
{
  EXPECT_EQ(
    reprint_program("import   *   as  x from 'y'  ;\nexport {x};"),
    "import   *   as  x from 'y'  ;\nexport {x};\n");
}

TEST(ExprPrinterTest, NullProgramPrintsNothing)
{
  EXPECT_EQ(print_program(nullptr), "");
  EXPECT_EQ(print_expr(nullptr), "");
}

}  // namespace refiner

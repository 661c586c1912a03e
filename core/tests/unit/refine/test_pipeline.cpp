// test_pipeline.cpp - Call-site refinement end to end
//
#include <gtest/gtest.h>

#include <memory>

#include "refiner/ast/expr_printer.hpp"
#include "refiner/refine/field_schema.hpp"
#include "refiner/refine/pipeline.hpp"
#include "refiner/test_support/parse_helpers.hpp"

namespace refiner
{

namespace
{

FieldSpec coerced(FieldType type)
{
  FieldSpec spec;
  spec.type = type;
  spec.coerce = true;
  return spec;
}

class PipelineTest : public ::testing::Test
{
protected:
  /// Refine `src` and return the printed program.
  std::string refine(const std::string & src, const CallSiteErrorHandler & on_error = {})
  {
    unit_ = test_support::parse(src);
    EXPECT_FALSE(unit_->diags.has_errors()) << src;
    modified_ = refine_program(unit_->program, unit_->ast, registry_, options_, on_error);
    return print_program(unit_->program);
  }

  RuleRegistry registry_;
  RefineOptions options_;
  std::unique_ptr<ParsedUnit> unit_;
  size_t modified_ = 0;
};

}  // namespace

TEST_F(PipelineTest, CoercesLeavesInPlace)
{
  ComponentRule rule;
  rule.schema = std::make_shared<FieldSchema>(
    std::vector<FieldSchema::Field>{{"count", coerced(FieldType::Number)}});
  registry_.add("Card", rule);

  EXPECT_EQ(
    refine("_jsx(Card, {count: \"3\", label: \"x\", children: _jsx(\"p\", {})});\n"),
    "_jsx(Card, {count: 3, label: \"x\", children: _jsx(\"p\", {})});\n");
  EXPECT_EQ(modified_, 1u);
}

TEST_F(PipelineTest, DeriveAndPruneRunInOrder)
{
  ComponentRule rule;
  rule.derive = [](const Value & props, DerivedPatchBuilder & builder) {
    const Value * title = props.object()->find("title");
    builder.set("slug", Value::make_string(title ? title->as_string() + "-slug" : "none"));
  };
  rule.prune_keys = std::vector<std::string>{"legacy", "children"};
  registry_.add("Post", rule);

  EXPECT_EQ(
    refine("jsx(Post, {title: \"hi\", slug: null, legacy: 1, children: c});"),
    "jsx(Post, {title: \"hi\", slug: \"hi-slug\", children: c});\n");
}

TEST_F(PipelineTest, UnchangedCallSiteIsNotCounted)
{
  ComponentRule rule;
  rule.schema = std::make_shared<FieldSchema>(
    std::vector<FieldSchema::Field>{{"count", coerced(FieldType::Number)}});
  registry_.add("Card", rule);

  const std::string src = "import {jsx} from \"react/jsx-runtime\";\njsx(Card, {count: 3});\n";
  EXPECT_EQ(refine(src), src);
  EXPECT_EQ(modified_, 0u);
}

TEST_F(PipelineTest, ReplacedArrayKeepsCapturedChildren)
{
  ComponentRule rule;
  rule.derive = [](const Value & props, DerivedPatchBuilder & builder) {
    const Value * items = props.object()->find("items");
    auto data = std::make_shared<ArrayData>(*items->array());
    data->elements.push_back(Value::object_of({{"id", Value::make_number(2)}}));
    builder.set("items", Value::make_array(data));
  };
  registry_.add("List", rule);

  EXPECT_EQ(
    refine("jsx(List, {items: [{id: 1, children: jsx(\"b\", {})}]});"),
    "jsx(List, {items: [{\"id\": 1, \"children\": jsx(\"b\", {})}, {\"id\": 2}]});\n");
}

TEST_F(PipelineTest, ValidatesWithoutRewritingInCheckMode)
{
  ComponentRule rule;
  rule.schema = std::make_shared<FieldSchema>(
    std::vector<FieldSchema::Field>{{"count", coerced(FieldType::Number)}});
  registry_.add("Card", rule);
  options_.apply_transforms = false;

  EXPECT_EQ(refine("jsx(Card, {count: \"3\"});"), "jsx(Card, {count: \"3\"});\n");
  EXPECT_EQ(modified_, 0u);

  EXPECT_THROW((void)refine("jsx(Card, {count: \"three\"});"), ValidationError);
}

TEST_F(PipelineTest, DerivedPropMissingFromLiteralFails)
{
  ComponentRule rule;
  rule.derive = [](const Value &, DerivedPatchBuilder & builder) {
    builder.set("size", Value::make_string("md"));
  };
  registry_.add("Card", rule);

  try {
    (void)refine("jsx(Card, {label: \"x\"});");
    FAIL() << "expected PatchApplicationError";
  } catch (const PatchApplicationError & e) {
    EXPECT_EQ(e.first_unapplied_path_key(), R"(["size"])");
    EXPECT_EQ(e.phase(), PatchPhase::Derive);
  }
}

TEST_F(PipelineTest, DeriveMayNotTouchPreservedKeys)
{
  ComponentRule rule;
  rule.derive = [](const Value &, DerivedPatchBuilder & builder) {
    builder.set("children", Value::make_string("x"));
  };
  registry_.add("Card", rule);

  EXPECT_THROW((void)refine("jsx(Card, {children: c});"), ConfigurationError);
}

TEST_F(PipelineTest, NonStaticPropsValidateAsNull)
{
  ComponentRule rule;
  rule.schema = std::make_shared<FieldSchema>();
  registry_.add("Card", rule);

  try {
    (void)refine("jsx(Card, props);");
    FAIL() << "expected ValidationError";
  } catch (const ValidationError & e) {
    EXPECT_STREQ(e.what(), "Invalid props for \"Card\" at \"\": Expected object, received null");
  }
}

TEST_F(PipelineTest, ErrorHandlerDecidesWhetherToContinue)
{
  ComponentRule rule;
  rule.schema = std::make_shared<FieldSchema>(
    std::vector<FieldSchema::Field>{{"n", coerced(FieldType::Number)}});
  registry_.add("Card", rule);

  const std::string src =
    "jsx(Card, {n: \"bad\"});\njsx(Card, {n: \"1\"});\njsx(Card, {n: \"also bad\"});\n";

  std::vector<std::string> failures;
  const std::string out = refine(src, [&](const ComponentMatch & match, const RefineError & e) {
    failures.push_back(match.component + ": " + to_string(e.kind()).data());
    return true;
  });
  EXPECT_EQ(failures, (std::vector<std::string>{"Card: validation", "Card: validation"}));
  EXPECT_EQ(modified_, 1u);
  EXPECT_NE(out.find("jsx(Card, {n: 1});"), std::string::npos);

  failures.clear();
  (void)refine(src, [&](const ComponentMatch &, const RefineError &) {
    failures.emplace_back("stop");
    return false;
  });
  EXPECT_EQ(failures.size(), 1u);
  EXPECT_EQ(modified_, 0u);
}

TEST_F(PipelineTest, NestedCallSitesAreRefinedToo)
{
  ComponentRule rule;
  rule.schema = std::make_shared<FieldSchema>(
    std::vector<FieldSchema::Field>{{"n", coerced(FieldType::Number)}});
  registry_.add("Card", rule);

  EXPECT_EQ(
    refine("jsx(Card, {n: \"1\", children: jsx(Card, {n: \"2\"})});"),
    "jsx(Card, {n: 1, children: jsx(Card, {n: 2})});\n");
  EXPECT_EQ(modified_, 2u);
}

}  // namespace refiner

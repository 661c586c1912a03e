// test_validator.cpp - Schema validation, field schemas and rule checks
//
#include <gtest/gtest.h>

#include <limits>
#include <memory>

#include "refiner/refine/error.hpp"
#include "refiner/refine/field_schema.hpp"
#include "refiner/refine/rule_validator.hpp"
#include "refiner/refine/validator.hpp"

namespace refiner
{

namespace
{

/// Schema returning a canned result.
class StubSchema : public Schema
{
public:
  explicit StubSchema(ValidationResult result, bool async = false)
  : result_(std::move(result)), async_(async)
  {
  }

  ValidationResult validate(const Value &) const override { return result_; }
  bool is_async() const noexcept override { return async_; }

private:
  ValidationResult result_;
  bool async_;
};

FieldSpec spec(FieldType type, bool required = false, bool coerce = false)
{
  FieldSpec out;
  out.type = type;
  out.required = required;
  out.coerce = coerce;
  return out;
}

}  // namespace

// ============================================================================
// validate_with_schema
// ============================================================================

TEST(ValidateWithSchema, NullSchemaPassesInputThrough)
{
  const Value input = Value::object_of({{"a", Value::make_number(1)}});
  EXPECT_EQ(validate_with_schema(nullptr, input, "Card").identity(), input.identity());
}

TEST(ValidateWithSchema, ResultWithoutValueKeepsInput)
{
  const Value input = Value::object_of({});
  StubSchema schema(ValidationResult{});
  EXPECT_EQ(validate_with_schema(&schema, input, "Card").identity(), input.identity());
}

TEST(ValidateWithSchema, ReturnsNormalizedValue)
{
  StubSchema schema(ValidationResult::success(Value::make_string("normalized")));
  EXPECT_EQ(validate_with_schema(&schema, Value::object_of({}), "Card").as_string(), "normalized");
}

TEST(ValidateWithSchema, AsyncSchemaIsRejected)
{
  StubSchema schema(ValidationResult{}, true);
  try {
    (void)validate_with_schema(&schema, Value::object_of({}), "Card");
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    EXPECT_STREQ(e.what(), "Async schema validation is not supported for \"Card\".");
  }
}

TEST(ValidateWithSchema, FirstIssueBecomesValidationError)
{
  StubSchema schema(ValidationResult::failure(
    {{PropertyPath{key_segment("size"), index_segment(0)}, "Expected number, received string"},
     {PropertyPath{key_segment("other")}, "Required"}}));
  try {
    (void)validate_with_schema(&schema, Value::object_of({}), "Card");
    FAIL() << "expected ValidationError";
  } catch (const ValidationError & e) {
    EXPECT_STREQ(
      e.what(), "Invalid props for \"Card\" at \"size.0\": Expected number, received string");
    ASSERT_TRUE(e.issue_path().has_value());
    EXPECT_EQ(e.issue_path()->size(), 2u);
    EXPECT_EQ(e.kind(), ErrorKind::Validation);
  }
}

TEST(ValidateWithSchema, IssueWithoutPathSaysUnknown)
{
  StubSchema schema(ValidationResult::failure({{std::nullopt, "bad"}}));
  try {
    (void)validate_with_schema(&schema, Value::object_of({}), "Card");
    FAIL() << "expected ValidationError";
  } catch (const ValidationError & e) {
    EXPECT_STREQ(e.what(), "Invalid props for \"Card\" at \"unknown\": bad");
    EXPECT_FALSE(e.issue_path().has_value());
  }
}

// ============================================================================
// FieldSchema
// ============================================================================

TEST(FieldSchema, ParsesTypeNames)
{
  EXPECT_EQ(parse_field_type("number"), FieldType::Number);
  EXPECT_EQ(parse_field_type("bool"), FieldType::Boolean);
  EXPECT_EQ(parse_field_type("boolean"), FieldType::Boolean);
  EXPECT_EQ(parse_field_type("any"), FieldType::Any);
  EXPECT_FALSE(parse_field_type("Number").has_value());
}

TEST(FieldSchema, MatchingInputIsReturnedAsIs)
{
  FieldSchema schema({{"n", spec(FieldType::Number)}, {"s", spec(FieldType::String)}});
  const Value input =
    Value::object_of({{"n", Value::make_number(1)}, {"s", Value::make_string("x")}});

  const auto result = schema.validate(input);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->identity(), input.identity());
}

TEST(FieldSchema, UnknownKeysPassThrough)
{
  FieldSchema schema({{"n", spec(FieldType::Number, false, true)}});
  const Value input =
    Value::object_of({{"n", Value::make_string("2")}, {"extra", Value::make_bool(true)}});

  const auto result = schema.validate(input);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(to_display_string(*result.value), R"({"n":2,"extra":true})");
  EXPECT_EQ(to_display_string(input), R"({"n":"2","extra":true})");
}

TEST(FieldSchema, CoercesStringsToNumbers)
{
  FieldSchema schema({{"n", spec(FieldType::Number, false, true)}});
  auto coerced = [&](const std::string & text) {
    return schema.validate(Value::object_of({{"n", Value::make_string(text)}}));
  };

  EXPECT_EQ(coerced(" 42 ").value->object()->find("n")->as_number(), 42);
  EXPECT_EQ(coerced("1e3").value->object()->find("n")->as_number(), 1000);
  EXPECT_EQ(
    coerced("-Infinity").value->object()->find("n")->as_number(),
    -std::numeric_limits<double>::infinity());
  EXPECT_FALSE(coerced("abc").ok());
  EXPECT_FALSE(coerced("").ok());
  EXPECT_FALSE(coerced("inf").ok());
  EXPECT_FALSE(coerced("NaN").ok());
}

TEST(FieldSchema, CoercesNumberTextLikeNumberConstructor)
{
  FieldSchema schema({{"n", spec(FieldType::Number, false, true)}});
  auto number_of = [&](const std::string & text) {
    return schema.validate(Value::object_of({{"n", Value::make_string(text)}}))
      .value->object()
      ->find("n")
      ->as_number();
  };
  auto rejects = [&](const std::string & text) {
    return !schema.validate(Value::object_of({{"n", Value::make_string(text)}})).ok();
  };

  EXPECT_EQ(number_of("0x1F"), 31);
  EXPECT_EQ(number_of("0o17"), 15);
  EXPECT_EQ(number_of("0B101"), 5);
  EXPECT_EQ(number_of("+2.5"), 2.5);
  EXPECT_EQ(number_of(".5"), 0.5);
  EXPECT_EQ(number_of("-1.5e2"), -150);

  EXPECT_TRUE(rejects("0x1p3"));
  EXPECT_TRUE(rejects("0x"));
  EXPECT_TRUE(rejects("-0x10"));
  EXPECT_TRUE(rejects("0b102"));
  EXPECT_TRUE(rejects("+-1"));
  EXPECT_TRUE(rejects("1,5"));
  EXPECT_TRUE(rejects("1e999"));
  EXPECT_TRUE(rejects("infinity"));
}

TEST(FieldSchema, CoercesBooleansAndStrings)
{
  FieldSchema schema({{"b", spec(FieldType::Boolean, false, true)},
                      {"s", spec(FieldType::String, false, true)},
                      {"n", spec(FieldType::Number, false, true)}});
  const auto result = schema.validate(Value::object_of(
    {{"b", Value::make_string("false")}, {"s", Value::make_number(1.5)},
     {"n", Value::make_bool(true)}}));

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(to_display_string(*result.value), R"({"b":false,"s":"1.5","n":1})");
}

TEST(FieldSchema, MismatchWithoutCoercionIsAnIssue)
{
  FieldSchema schema({{"n", spec(FieldType::Number)}});
  const auto result = schema.validate(Value::object_of({{"n", Value::make_string("1")}}));

  ASSERT_EQ(result.issues.size(), 1u);
  EXPECT_EQ(result.issues[0].message, "Expected number, received string");
  EXPECT_EQ(result.issues[0].path, (PropertyPath{key_segment("n")}));
}

TEST(FieldSchema, NaNIsNotANumber)
{
  FieldSchema schema({{"n", spec(FieldType::Number)}});
  const auto result = schema.validate(
    Value::object_of({{"n", Value::make_number(std::numeric_limits<double>::quiet_NaN())}}));
  ASSERT_EQ(result.issues.size(), 1u);
  EXPECT_EQ(result.issues[0].message, "Expected number, received nan");
}

TEST(FieldSchema, RequiredAndDefaults)
{
  FieldSpec with_default = spec(FieldType::String);
  with_default.default_value = Value::make_string("md");
  FieldSchema schema({{"size", with_default}, {"title", spec(FieldType::String, true)}});

  const auto missing = schema.validate(Value::object_of({}));
  ASSERT_EQ(missing.issues.size(), 1u);
  EXPECT_EQ(missing.issues[0].message, "Required");
  EXPECT_EQ(missing.issues[0].path, (PropertyPath{key_segment("title")}));

  const auto filled = schema.validate(
    Value::object_of({{"title", Value::make_string("t")}, {"size", Value{}}}));
  ASSERT_TRUE(filled.ok());
  EXPECT_EQ(filled.value->object()->find("size")->as_string(), "md");
}

TEST(FieldSchema, NonObjectInput)
{
  FieldSchema schema;
  const auto result = schema.validate(Value::make_null());
  ASSERT_EQ(result.issues.size(), 1u);
  EXPECT_EQ(result.issues[0].message, "Expected object, received null");
  ASSERT_TRUE(result.issues[0].path.has_value());
  EXPECT_TRUE(result.issues[0].path->empty());
}

TEST(FieldSchema, AddFieldReplacesExisting)
{
  FieldSchema schema;
  schema.add_field("x", spec(FieldType::String));
  schema.add_field("x", spec(FieldType::Number));
  ASSERT_EQ(schema.fields().size(), 1u);
  EXPECT_EQ(schema.fields()[0].second.type, FieldType::Number);
}

// ============================================================================
// Rules
// ============================================================================

TEST(RuleValidator, MissingRule)
{
  try {
    (void)validate_rule(nullptr, "Card");
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    EXPECT_STREQ(e.what(), "Invalid rule for \"Card\": Expected a rule object, got undefined.");
  }
}

TEST(RuleValidator, EmptyRule)
{
  const ComponentRule rule;
  try {
    (void)validate_rule(&rule, "Card");
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError & e) {
    EXPECT_STREQ(
      e.what(),
      "Invalid rule for \"Card\": The rule is empty. It must define at least one of: 'schema', "
      "'derive', or 'pruneKeys'.");
  }
}

TEST(RuleValidator, AnyMemberMakesRuleUsable)
{
  ComponentRule prune_only;
  prune_only.prune_keys = std::vector<std::string>{};
  EXPECT_EQ(&validate_rule(&prune_only, "Card"), &prune_only);

  ComponentRule schema_only;
  schema_only.schema = std::make_shared<FieldSchema>();
  EXPECT_NO_THROW((void)validate_rule(&schema_only, "Card"));
}

TEST(RuleRegistry, LaterRegistrationReplaces)
{
  RuleRegistry registry;
  ComponentRule first;
  first.prune_keys = std::vector<std::string>{"a"};
  ComponentRule second;
  second.prune_keys = std::vector<std::string>{"b"};

  registry.add("Card", first);
  registry.add("Badge", first);
  registry.add("Card", second);

  EXPECT_EQ(registry.size(), 2u);
  EXPECT_EQ(registry.names(), (std::vector<std::string>{"Card", "Badge"}));
  ASSERT_NE(registry.find("Card"), nullptr);
  EXPECT_EQ(registry.find("Card")->prune_keys->front(), "b");
  EXPECT_FALSE(registry.contains("Missing"));
}

}  // namespace refiner

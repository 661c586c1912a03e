// refiner/refine/field_schema.cpp - Declarative per-field props schema
#include "refiner/refine/field_schema.hpp"

#include <charconv>
#include <cmath>
#include <fmt/format.h>
#include <memory>
#include <string_view>
#include <system_error>

#include "refiner/basic/js_format.hpp"

namespace refiner
{

std::optional<FieldType> parse_field_type(std::string_view name)
{
  if (name == "any") return FieldType::Any;
  if (name == "string") return FieldType::String;
  if (name == "number") return FieldType::Number;
  if (name == "boolean" || name == "bool") return FieldType::Boolean;
  if (name == "array") return FieldType::Array;
  if (name == "object") return FieldType::Object;
  return std::nullopt;
}

void FieldSchema::add_field(std::string name, FieldSpec spec)
{
  for (auto & field : fields_) {
    if (field.first == name) {
      field.second = std::move(spec);
      return;
    }
  }
  fields_.emplace_back(std::move(name), std::move(spec));
}

namespace
{

std::string_view received_name(const Value & value)
{
  if (value.is_number() && std::isnan(value.as_number())) return "nan";
  return to_string(value.kind());
}

bool matches(FieldType type, const Value & value)
{
  switch (type) {
    case FieldType::Any:
      return true;
    case FieldType::String:
      return value.is_string();
    case FieldType::Number:
      return value.is_number() && !std::isnan(value.as_number());
    case FieldType::Boolean:
      return value.is_bool();
    case FieldType::Array:
      return value.is_array();
    case FieldType::Object:
      return value.is_object();
  }
  return false;
}

/// Unsigned integer digits in `base`, as `Number("0x..")` reads them.
std::optional<double> parse_radix_digits(std::string_view digits, int base)
{
  if (digits.empty()) return std::nullopt;
  double value = 0;
  for (const char c : digits) {
    int d = -1;
    if (c >= '0' && c <= '9') {
      d = c - '0';
    } else if (c >= 'a' && c <= 'z') {
      d = 10 + (c - 'a');
    } else if (c >= 'A' && c <= 'Z') {
      d = 10 + (c - 'A');
    }
    if (d < 0 || d >= base) return std::nullopt;
    value = value * base + d;
  }
  return value;
}

std::optional<double> parse_number(const std::string & text)
{
  const auto first = text.find_first_not_of(" \t\n\r");
  if (first == std::string::npos) return std::nullopt;
  const auto last = text.find_last_not_of(" \t\n\r");
  std::string_view trimmed(text.data() + first, last - first + 1);

  if (trimmed == "Infinity" || trimmed == "+Infinity") return HUGE_VAL;
  if (trimmed == "-Infinity") return -HUGE_VAL;

  // 0x / 0o / 0b take no sign and no fraction
  if (trimmed.size() > 2 && trimmed[0] == '0') {
    switch (trimmed[1]) {
      case 'x':
      case 'X':
        return parse_radix_digits(trimmed.substr(2), 16);
      case 'o':
      case 'O':
        return parse_radix_digits(trimmed.substr(2), 8);
      case 'b':
      case 'B':
        return parse_radix_digits(trimmed.substr(2), 2);
      default:
        break;
    }
  }

  std::string_view body = trimmed;
  const bool plus = body.front() == '+';
  if (plus) body.remove_prefix(1);
  if (body.empty() || (plus && (body.front() == '+' || body.front() == '-'))) return std::nullopt;
  // from_chars also reads "inf" and "nan" spellings
  if (body.find_first_not_of("0123456789+-.eE") != std::string_view::npos) return std::nullopt;

  double parsed = 0;
  const auto res = std::from_chars(body.data(), body.data() + body.size(), parsed);
  if (res.ec != std::errc() || res.ptr != body.data() + body.size()) return std::nullopt;
  if (!std::isfinite(parsed)) return std::nullopt;
  return parsed;
}

/// Coerced form of `value` for `type`, or nullopt when no conversion applies.
std::optional<Value> coerce_value(FieldType type, const Value & value)
{
  switch (type) {
    case FieldType::Number:
      if (value.is_string()) {
        if (auto n = parse_number(value.as_string())) return Value::make_number(*n);
      }
      if (value.is_bool()) return Value::make_number(value.as_bool() ? 1.0 : 0.0);
      return std::nullopt;
    case FieldType::Boolean:
      if (value.is_string()) {
        if (value.as_string() == "true") return Value::make_bool(true);
        if (value.as_string() == "false") return Value::make_bool(false);
      }
      return std::nullopt;
    case FieldType::String:
      if (value.is_number()) return Value::make_string(format_js_number(value.as_number()));
      if (value.is_bool()) return Value::make_string(value.as_bool() ? "true" : "false");
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace

ValidationResult FieldSchema::validate(const Value & input) const
{
  if (!input.is_object()) {
    return ValidationResult::failure(
      {{PropertyPath{}, fmt::format("Expected object, received {}", received_name(input))}});
  }

  std::vector<ValidationIssue> issues;
  std::shared_ptr<ObjectData> output;  // Copied on first change

  auto write = [&](const std::string & key, Value value) {
    if (!output) output = std::make_shared<ObjectData>(*input.object());
    output->set(key, std::move(value));
  };

  for (const auto & [name, spec] : fields_) {
    const Value * current = input.object()->find(name);

    if (!current || current->is_undefined()) {
      if (spec.default_value) {
        write(name, *spec.default_value);
      } else if (spec.required) {
        issues.push_back({PropertyPath{key_segment(name)}, "Required"});
      }
      continue;
    }

    if (matches(spec.type, *current)) continue;

    if (spec.coerce) {
      if (auto coerced = coerce_value(spec.type, *current)) {
        write(name, std::move(*coerced));
        continue;
      }
    }

    issues.push_back(
      {PropertyPath{key_segment(name)},
       fmt::format("Expected {}, received {}", to_string(spec.type), received_name(*current))});
  }

  if (!issues.empty()) return ValidationResult::failure(std::move(issues));
  return ValidationResult::success(output ? Value::make_object(std::move(output)) : input);
}

}  // namespace refiner

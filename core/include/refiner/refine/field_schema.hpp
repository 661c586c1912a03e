// refiner/refine/field_schema.hpp - Declarative per-field props schema
//
// The schema form used by refiner.yaml. Each configured field is checked
// against a type, optionally coerced, and optionally defaulted. Fields the
// schema does not name pass through untouched.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "refiner/refine/validator.hpp"

namespace refiner
{

enum class FieldType : uint8_t {
  Any,
  String,
  Number,
  Boolean,
  Array,
  Object,
};

[[nodiscard]] constexpr std::string_view to_string(FieldType type)
{
  switch (type) {
    case FieldType::Any:
      return "any";
    case FieldType::String:
      return "string";
    case FieldType::Number:
      return "number";
    case FieldType::Boolean:
      return "boolean";
    case FieldType::Array:
      return "array";
    case FieldType::Object:
      return "object";
  }
  return "unknown";
}

/// Parse a type name as written in configuration.
[[nodiscard]] std::optional<FieldType> parse_field_type(std::string_view name);

struct FieldSpec
{
  FieldType type = FieldType::Any;
  bool required = false;

  /// Convert strings to numbers/booleans and numbers/booleans to strings.
  bool coerce = false;

  /// Written to the validated output when the field is missing.
  std::optional<Value> default_value;
};

class FieldSchema : public Schema
{
public:
  using Field = std::pair<std::string, FieldSpec>;

  FieldSchema() = default;
  explicit FieldSchema(std::vector<Field> fields) : fields_(std::move(fields)) {}

  /// Add or replace the spec for `name`.
  void add_field(std::string name, FieldSpec spec);

  [[nodiscard]] const std::vector<Field> & fields() const noexcept { return fields_; }

  [[nodiscard]] ValidationResult validate(const Value & input) const override;

private:
  std::vector<Field> fields_;
};

}  // namespace refiner

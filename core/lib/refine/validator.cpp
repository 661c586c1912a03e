// refiner/refine/validator.cpp - Schema validation entry point
#include "refiner/refine/validator.hpp"

#include <fmt/format.h>

#include "refiner/refine/error.hpp"

namespace refiner
{

Value validate_with_schema(const Schema * schema, const Value & input, std::string_view component)
{
  if (!schema) return input;

  if (schema->is_async()) {
    throw ConfigurationError(
      fmt::format("Async schema validation is not supported for \"{}\".", component));
  }

  ValidationResult result = schema->validate(input);
  if (!result.issues.empty()) {
    const ValidationIssue & first = result.issues.front();
    const std::string where = first.path ? join_property_path(*first.path) : "unknown";
    throw ValidationError(
      fmt::format("Invalid props for \"{}\" at \"{}\": {}", component, where, first.message),
      first.path);
  }

  if (result.value) return std::move(*result.value);
  return input;
}

}  // namespace refiner

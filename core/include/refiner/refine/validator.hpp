// refiner/refine/validator.hpp - Schema interface and validation entry point
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refiner/model/value.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

struct ValidationIssue
{
  std::optional<PropertyPath> path;  ///< Location inside the input, when known
  std::string message;
};

/**
 * Outcome of one schema run.
 *
 * Any issue means failure. A successful result may omit `value`, in which
 * case the input is taken as the validated value.
 */
struct ValidationResult
{
  std::optional<Value> value;
  std::vector<ValidationIssue> issues;

  static ValidationResult success(Value v) { return {std::move(v), {}}; }
  static ValidationResult failure(std::vector<ValidationIssue> issues)
  {
    return {std::nullopt, std::move(issues)};
  }

  [[nodiscard]] bool ok() const noexcept { return issues.empty(); }
};

/**
 * Validator for one component's props.
 *
 * Implementations may normalize the input (coerce, fill defaults) and
 * return the normalized value.
 */
class Schema
{
public:
  virtual ~Schema() = default;

  [[nodiscard]] virtual ValidationResult validate(const Value & input) const = 0;

  /// Asynchronous schemas cannot run during a tree walk and are rejected.
  [[nodiscard]] virtual bool is_async() const noexcept { return false; }
};

/**
 * Run `schema` against `input`.
 *
 * @return the validated value; `input` itself when `schema` is null or
 *         the result carries no value
 * @throws ConfigurationError for an asynchronous schema
 * @throws ValidationError with the first issue
 */
[[nodiscard]] Value validate_with_schema(
  const Schema * schema, const Value & input, std::string_view component);

}  // namespace refiner

// refiner/refine/rule_validator.hpp - Registry entry sanity checks
#pragma once

#include <string_view>

#include "refiner/refine/rule.hpp"

namespace refiner
{

/**
 * Check that a registry entry is usable.
 *
 * @return `rule`, for chaining
 * @throws ConfigurationError when `rule` is null or sets none of schema,
 *         derive and prune keys
 */
const ComponentRule & validate_rule(const ComponentRule * rule, std::string_view component);

}  // namespace refiner

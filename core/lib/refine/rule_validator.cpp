// refiner/refine/rule_validator.cpp - Registry entry sanity checks
#include "refiner/refine/rule_validator.hpp"

#include <fmt/format.h>

#include "refiner/refine/error.hpp"

namespace refiner
{

const ComponentRule & validate_rule(const ComponentRule * rule, std::string_view component)
{
  if (!rule) {
    throw ConfigurationError(fmt::format(
      "Invalid rule for \"{}\": Expected a rule object, got undefined.", component));
  }

  const bool effective = rule->schema || rule->derive || rule->prune_keys.has_value();
  if (!effective) {
    throw ConfigurationError(fmt::format(
      "Invalid rule for \"{}\": The rule is empty. "
      "It must define at least one of: 'schema', 'derive', or 'pruneKeys'.",
      component));
  }
  return *rule;
}

}  // namespace refiner

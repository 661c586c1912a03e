// refiner/refine/rule.cpp - Per-component refinement rules
#include "refiner/refine/rule.hpp"

#include <utility>

namespace refiner
{

void RuleRegistry::add(std::string component, ComponentRule rule)
{
  auto it = rules_.find(component);
  if (it != rules_.end()) {
    it->second = std::move(rule);
    return;
  }
  names_.push_back(component);
  rules_.emplace(std::move(component), std::move(rule));
}

const ComponentRule * RuleRegistry::find(std::string_view component) const
{
  const auto it = rules_.find(std::string(component));
  return it == rules_.end() ? nullptr : &it->second;
}

}  // namespace refiner

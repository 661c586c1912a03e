// refiner/refine/rule.hpp - Per-component refinement rules
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "refiner/refine/derive_patches.hpp"
#include "refiner/refine/validator.hpp"

namespace refiner
{

/**
 * What to do with one component's props.
 *
 * A usable rule sets at least one member.
 */
struct ComponentRule
{
  std::shared_ptr<const Schema> schema;         ///< Validation and normalization
  DeriveFn derive;                              ///< Computed props
  std::optional<std::vector<std::string>> prune_keys;  ///< Top-level keys to drop
};

/// Component name to rule. Later registrations replace earlier ones.
class RuleRegistry
{
public:
  void add(std::string component, ComponentRule rule);

  /// Rule for `component`, or nullptr when it is not registered.
  [[nodiscard]] const ComponentRule * find(std::string_view component) const;

  [[nodiscard]] bool contains(std::string_view component) const { return find(component); }

  /// Registered names in registration order.
  [[nodiscard]] const std::vector<std::string> & names() const noexcept { return names_; }

  [[nodiscard]] size_t size() const noexcept { return names_.size(); }
  [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

private:
  std::unordered_map<std::string, ComponentRule> rules_;
  std::vector<std::string> names_;
};

}  // namespace refiner

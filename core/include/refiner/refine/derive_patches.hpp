// refiner/refine/derive_patches.hpp - Root-level patches emitted by derive hooks
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "refiner/model/value.hpp"
#include "refiner/refine/patch.hpp"

namespace refiner
{

/**
 * Collects the values a derive hook sets.
 *
 * Every key becomes a root-level Set patch, in call order. The builder is
 * single use: any call after build() throws ConfigurationError.
 */
class DerivedPatchBuilder
{
public:
  /// Set every own property of `record`, which must be an object.
  void set(const Value & record);

  /// Set a single root-level prop.
  void set(std::string key, Value value);

  [[nodiscard]] std::vector<PropertyPatch> build();

private:
  void ensure_not_built() const;

  std::vector<PropertyPatch> patches_;
  bool built_ = false;
};

/// User hook computing extra props from the validated props.
using DeriveFn = std::function<void(const Value & input, DerivedPatchBuilder & builder)>;

/// Run `derive` (if any) over `input` and return its patches.
[[nodiscard]] std::vector<PropertyPatch> collect_derive_patches(
  const DeriveFn & derive, const Value & input);

}  // namespace refiner

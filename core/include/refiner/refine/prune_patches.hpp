// refiner/refine/prune_patches.hpp - Root-level delete patches for pruned props
#pragma once

#include <string>
#include <vector>

#include "refiner/model/value.hpp"
#include "refiner/refine/patch.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

/**
 * One root-level Delete patch per prune key that `extracted` owns.
 *
 * Duplicate keys collapse to their first occurrence; preserved keys and
 * keys the extracted props do not have are skipped.
 */
[[nodiscard]] std::vector<PropertyPatch> plan_prune_patches(
  const Value & extracted, const std::vector<std::string> & prune_keys,
  const PreservedKeySet & preserved_keys);

}  // namespace refiner

// refiner/refine/patch_planner.hpp - Coercion patches from validated data
#pragma once

#include <vector>

#include "refiner/model/value.hpp"
#include "refiner/refine/patch.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

/**
 * Plan the coercion (diff phase) patches for one call site.
 *
 * Diffs `extracted` against apply_overlay(extracted, validated) with the
 * atomic/reference array policy. Only CHANGE events become Set patches:
 * a CREATE has no slot to write and a REMOVE would drop data the schema
 * did not know about. Returns nothing unless both inputs are objects.
 */
[[nodiscard]] std::vector<PropertyPatch> calculate_patches(
  const Value & extracted, const Value & validated, const PreservedKeySet & preserved_keys);

}  // namespace refiner

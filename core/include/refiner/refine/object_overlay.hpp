// refiner/refine/object_overlay.hpp - Fixed-topology merge producing the diff target
#pragma once

#include "refiner/model/value.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

/**
 * Left-join `overlay` onto `base`.
 *
 * `base` fixes the topology: keys missing from base are never added and
 * keys missing from overlay are kept. Preserved keys always keep the base
 * value. Arrays are replaced wholesale; nested objects merge recursively;
 * anything else takes the overlay value.
 *
 * A new object is allocated only on the first real divergence, so an
 * unchanged subtree comes back as the very same shared container. The
 * differ's atomic reference array policy relies on this.
 *
 * Both arguments are expected to be objects; otherwise `base` is returned.
 */
[[nodiscard]] Value apply_overlay(
  const Value & base, const Value & overlay, const PreservedKeySet & preserved_keys);

}  // namespace refiner

// refiner/refine/patch_guards.hpp - Reject patches aimed at runtime-owned subtrees
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "refiner/refine/patch.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

enum class GuardScope : uint8_t {
  RootOnly,  ///< Check the first path segment only
  Anywhere,  ///< Check every string segment
};

struct PreservationCheckOptions
{
  GuardScope scope = GuardScope::RootOnly;
  std::string key_type_label = "preserved";
};

/**
 * Throw ConfigurationError for the first patch whose path hits a
 * restricted key.
 */
void assert_patches_respect_preservation(
  const std::vector<PropertyPatch> & patches, const PreservedKeySet & restricted_keys,
  std::string_view component_name, const PreservationCheckOptions & options = {});

}  // namespace refiner

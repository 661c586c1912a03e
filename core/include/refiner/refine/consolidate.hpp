// refiner/refine/consolidate.hpp - One patch per canonical path
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "refiner/refine/patch.hpp"

namespace refiner
{

struct ConsolidatedPatches
{
  /// In first-insertion order of their canonical path.
  std::vector<PropertyPatch> patches;

  /// Phase of the last group that wrote each canonical path.
  std::unordered_map<std::string, PatchPhase> phase_by_path_key;

  [[nodiscard]] std::optional<PatchPhase> phase_of(const std::string & path_key) const;
};

/**
 * Merge patch groups so each canonical path has one patch.
 *
 * Groups are applied in order; a later patch for the same path replaces
 * the earlier one in place, and its group's phase is recorded.
 */
[[nodiscard]] ConsolidatedPatches consolidate_patches(const std::vector<PatchGroup> & groups);

}  // namespace refiner

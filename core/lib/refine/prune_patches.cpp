// refiner/refine/prune_patches.cpp - Root-level delete patches for pruned props
#include "refiner/refine/prune_patches.hpp"

#include <unordered_set>

namespace refiner
{

std::vector<PropertyPatch> plan_prune_patches(
  const Value & extracted, const std::vector<std::string> & prune_keys,
  const PreservedKeySet & preserved_keys)
{
  if (prune_keys.empty() || !extracted.is_object()) return {};

  std::vector<PropertyPatch> patches;
  std::unordered_set<std::string> seen;
  for (const auto & key : prune_keys) {
    if (!seen.insert(key).second) continue;
    if (is_key_preserved(key, preserved_keys)) continue;
    if (!extracted.object()->has(key)) continue;

    patches.push_back(PropertyPatch::remove({key_segment(key)}));
  }
  return patches;
}

}  // namespace refiner

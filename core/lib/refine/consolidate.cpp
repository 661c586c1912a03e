// refiner/refine/consolidate.cpp - One patch per canonical path
#include "refiner/refine/consolidate.hpp"

namespace refiner
{

std::optional<PatchPhase> ConsolidatedPatches::phase_of(const std::string & path_key) const
{
  const auto it = phase_by_path_key.find(path_key);
  if (it == phase_by_path_key.end()) return std::nullopt;
  return it->second;
}

ConsolidatedPatches consolidate_patches(const std::vector<PatchGroup> & groups)
{
  ConsolidatedPatches out;
  std::unordered_map<std::string, size_t> slot_by_path_key;

  for (const auto & group : groups) {
    for (const auto & patch : group.patches) {
      std::string path_key = stringify_property_path(patch.path);

      const auto [it, inserted] = slot_by_path_key.emplace(path_key, out.patches.size());
      if (inserted) {
        out.patches.push_back(patch);
      } else {
        out.patches[it->second] = patch;
      }
      out.phase_by_path_key[std::move(path_key)] = group.phase;
    }
  }
  return out;
}

}  // namespace refiner

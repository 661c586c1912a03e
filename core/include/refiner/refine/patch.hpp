// refiner/refine/patch.hpp - Leaf-only patch operations
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "refiner/model/value.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

enum class PatchOperation : uint8_t {
  Set,     ///< Overwrite the value of an existing slot
  Delete,  ///< Remove a keyed slot, or clear an ordered slot to a hole
};

/// Planning phase that produced a patch. Kept for diagnostics only.
enum class PatchPhase : uint8_t {
  Diff,
  Derive,
  Prune,
};

[[nodiscard]] constexpr std::string_view to_string(PatchPhase phase)
{
  switch (phase) {
    case PatchPhase::Diff:
      return "diff";
    case PatchPhase::Derive:
      return "derive";
    case PatchPhase::Prune:
      return "prune";
  }
  return "unknown";
}

struct PropertyPatch
{
  PatchOperation operation = PatchOperation::Set;
  PropertyPath path;
  Value value;  ///< Only meaningful for Set

  static PropertyPatch set(PropertyPath path, Value value)
  {
    return {PatchOperation::Set, std::move(path), std::move(value)};
  }

  static PropertyPatch remove(PropertyPath path)
  {
    return {PatchOperation::Delete, std::move(path), Value{}};
  }
};

struct PatchGroup
{
  PatchPhase phase;
  std::vector<PropertyPatch> patches;
};

}  // namespace refiner

// refiner/refine/patch_planner.cpp - Coercion patches from validated data
#include "refiner/refine/patch_planner.hpp"

#include "refiner/refine/differ.hpp"
#include "refiner/refine/object_overlay.hpp"

namespace refiner
{

std::vector<PropertyPatch> calculate_patches(
  const Value & extracted, const Value & validated, const PreservedKeySet & preserved_keys)
{
  if (!extracted.is_object() || !validated.is_object()) return {};

  const Value diff_target = apply_overlay(extracted, validated, preserved_keys);

  DiffOptions options;
  options.arrays = ArrayStrategy::Atomic;
  options.array_equality = ArrayEquality::Reference;

  std::vector<PropertyPatch> patches;
  for (auto & event : diff(extracted, diff_target, options)) {
    switch (event.type) {
      case DiffType::Change:
        patches.push_back(PropertyPatch::set(std::move(event.path), std::move(event.value)));
        break;
      case DiffType::Create:
      case DiffType::Remove:
        break;
    }
  }
  return patches;
}

}  // namespace refiner

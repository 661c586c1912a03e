// refiner/refine/derive_patches.cpp - Root-level patches emitted by derive hooks
#include "refiner/refine/derive_patches.hpp"

#include <fmt/format.h>
#include <utility>

#include "refiner/refine/error.hpp"

namespace refiner
{

void DerivedPatchBuilder::ensure_not_built() const
{
  if (built_) {
    throw ConfigurationError(
      "DerivedPatchBuilder is single-use. It has already been finalized via build().");
  }
}

void DerivedPatchBuilder::set(const Value & record)
{
  ensure_not_built();
  if (!record.is_object()) {
    throw ConfigurationError(fmt::format(
      "Derived props must be an object, got {}.", to_string(record.kind())));
  }
  for (const auto & [key, value] : *record.object()) {
    patches_.push_back(PropertyPatch::set({key_segment(key)}, value));
  }
}

void DerivedPatchBuilder::set(std::string key, Value value)
{
  ensure_not_built();
  patches_.push_back(PropertyPatch::set({key_segment(std::move(key))}, std::move(value)));
}

std::vector<PropertyPatch> DerivedPatchBuilder::build()
{
  ensure_not_built();
  built_ = true;
  return std::move(patches_);
}

std::vector<PropertyPatch> collect_derive_patches(const DeriveFn & derive, const Value & input)
{
  if (!derive) return {};

  DerivedPatchBuilder builder;
  derive(input, builder);
  return builder.build();
}

}  // namespace refiner

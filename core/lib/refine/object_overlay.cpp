// refiner/refine/object_overlay.cpp - Fixed-topology merge producing the diff target
#include "refiner/refine/object_overlay.hpp"

#include <memory>

namespace refiner
{

namespace
{

Value merge_value(
  const Value & base_value, const Value & overlay_value, const PreservedKeySet & preserved);

Value overlay_object(const Value & base, const Value & overlay, const PreservedKeySet & preserved)
{
  std::shared_ptr<ObjectData> result;

  for (const auto & [key, overlay_child] : *overlay.object()) {
    if (is_key_preserved(key, preserved)) continue;

    const Value * base_child = base.object()->find(key);
    if (!base_child) continue;

    Value merged = merge_value(*base_child, overlay_child, preserved);
    if (same_value(merged, *base_child)) continue;

    if (!result) result = std::make_shared<ObjectData>(*base.object());
    result->set(key, std::move(merged));
  }

  return result ? Value::make_object(std::move(result)) : base;
}

Value merge_value(
  const Value & base_value, const Value & overlay_value, const PreservedKeySet & preserved)
{
  if (same_value(base_value, overlay_value)) return base_value;

  if (base_value.is_array() && overlay_value.is_array()) return overlay_value;

  if (base_value.is_object() && overlay_value.is_object()) {
    return overlay_object(base_value, overlay_value, preserved);
  }

  return overlay_value;
}

}  // namespace

Value apply_overlay(
  const Value & base, const Value & overlay, const PreservedKeySet & preserved_keys)
{
  if (!base.is_object() || !overlay.is_object()) return base;
  if (same_value(base, overlay)) return base;
  return overlay_object(base, overlay, preserved_keys);
}

}  // namespace refiner

// refiner/refine/key_extractor.cpp - Static labels of keyed slots
#include "refiner/refine/key_extractor.hpp"

#include "refiner/basic/js_format.hpp"
#include "refiner/refine/static_resolver.hpp"

namespace refiner
{

std::optional<std::string> extract_property_key(const Property * property)
{
  if (!property || !property->key) return std::nullopt;

  if (!property->computed) {
    if (const auto * ident = dyn_cast<Identifier>(property->key)) {
      return std::string(ident->name);
    }
  }

  const auto resolved = try_resolve_static_value(property->key);
  if (!resolved) return std::nullopt;

  if (resolved->is_string()) return resolved->as_string();
  if (resolved->is_number()) return format_js_number(resolved->as_number());
  return std::nullopt;
}

}  // namespace refiner

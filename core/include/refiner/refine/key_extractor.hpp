// refiner/refine/key_extractor.hpp - Static labels of keyed slots
#pragma once

#include <optional>
#include <string>

#include "refiner/ast/ast.hpp"

namespace refiner
{

/**
 * Static label of an object property, as JavaScript would name it.
 *
 * A non-computed identifier key yields its name. Any other key is resolved
 * as a leaf; only string and number results are accepted, and numbers are
 * converted to property-name text (`{1: x}` and `{[1]: x}` both give "1").
 * Booleans, null, undefined and bigints are rejected.
 *
 * @return nullopt for dynamic or rejected keys
 */
[[nodiscard]] std::optional<std::string> extract_property_key(const Property * property);

}  // namespace refiner

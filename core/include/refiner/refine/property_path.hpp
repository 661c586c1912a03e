// refiner/refine/property_path.hpp - Logical paths and their canonical string keys
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace refiner
{

/**
 * One step of a logical path.
 *
 * A string names a keyed-container slot; a number is an ordered-container
 * index. The extractor only ever produces strings for keyed slots (numeric
 * literal keys are coerced to their property-name text).
 */
using PathSegment = std::variant<std::string, double>;

using PropertyPath = std::vector<PathSegment>;

using PreservedKeySet = std::unordered_set<std::string>;

/// Build a path segment naming a keyed slot.
[[nodiscard]] inline PathSegment key_segment(std::string key) { return PathSegment(std::move(key)); }

/// Build a path segment naming an ordered slot.
[[nodiscard]] inline PathSegment index_segment(size_t index)
{
  return PathSegment(static_cast<double>(index));
}

// ============================================================================
// Canonical keys
// ============================================================================

/**
 * Canonicalize a path into a stable, collision-free string key.
 *
 * The key is JSON array text. NaN, Infinity and -Infinity segments become
 * the string tokens "NaN", "Infinity" and "-Infinity"; -0 becomes 0.
 *
 * @code
 *   stringify_property_path({"items", 0.0, "id"})  // ["items",0,"id"]
 * @endcode
 */
[[nodiscard]] std::string stringify_property_path(const PropertyPath & path);

/**
 * Parse a canonical key back into a path.
 *
 * Returns nullopt when `key` is not JSON text for an array of strings and
 * numbers.
 */
[[nodiscard]] std::optional<PropertyPath> parse_property_path_key(std::string_view key);

// ============================================================================
// Display
// ============================================================================

/// `String(segment)`: the slot name, or the JS number text of an index.
[[nodiscard]] std::string segment_to_string(const PathSegment & segment);

/// Join the segments with `separator`, the way `Array.prototype.join` does.
[[nodiscard]] std::string join_property_path(
  const PropertyPath & path, std::string_view separator = ".");

/**
 * Diagnostic label for a location below `base`.
 *
 * Keys append as `.key`, indices as `[i]`:
 * `format_path_label("Card.props", {"items", 0.0})` is `Card.props.items[0]`.
 */
[[nodiscard]] std::string format_path_label(std::string_view base, const PropertyPath & path);

// ============================================================================
// Preservation
// ============================================================================

/// True when the object key `key` is one of the preserved keys.
[[nodiscard]] bool is_key_preserved(const std::string & key, const PreservedKeySet & keys);

/// True when `String(segment)` is one of the preserved keys.
[[nodiscard]] bool is_key_preserved(const PathSegment & segment, const PreservedKeySet & keys);

}  // namespace refiner

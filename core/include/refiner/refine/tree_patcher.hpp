// refiner/refine/tree_patcher.hpp - Apply property patches to an expression tree
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_context.hpp"
#include "refiner/refine/patch.hpp"
#include "refiner/refine/property_path.hpp"
#include "refiner/refine/value_encoder.hpp"

namespace refiner
{

/// Outcome of one patch run. Nothing is reported when every patch landed.
struct ApplyPatchesResult
{
  /// Remaining set key if any, otherwise the first remaining delete key.
  std::optional<std::string> first_unapplied_path_key;

  std::vector<std::string> remaining_set_path_keys;     ///< In patch order
  std::vector<std::string> remaining_delete_path_keys;  ///< In patch order

  size_t remaining_set_count = 0;
  size_t remaining_delete_count = 0;

  [[nodiscard]] bool fully_applied() const noexcept
  {
    return remaining_set_count == 0 && remaining_delete_count == 0;
  }
};

/**
 * Walk the literal tree under `root` and apply `patches` in place.
 *
 * Only object property values and array elements are followed; a slot is
 * addressable when every key on its path is static. Per slot:
 * - a preserved key is skipped and its subtree is never entered;
 * - a matching delete removes the property, or turns an array element
 *   into a hole;
 * - a matching set replaces the value (or fills a hole) with the encoded
 *   patch value, then traversal continues into the new value.
 *
 * Sets sharing a path keep the last value. A non-object root applies
 * nothing and reports every patch as remaining.
 *
 * With duplicate keys (`{a: 1, a: 2}`) only the first slot is patched and
 * the patch counts as applied, although the later slot wins at runtime.
 *
 * @throws EncodingError when a set value cannot be encoded
 */
[[nodiscard]] ApplyPatchesResult apply_patches(
  AstContext & ast, Expr * root, const std::vector<PropertyPatch> & patches,
  const PreservedKeySet & preserved_keys, const ExpressionRefResolver & resolver);

}  // namespace refiner

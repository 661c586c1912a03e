// refiner/refine/extractor.hpp - Decode expression subtrees into plain data
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "refiner/ast/ast.hpp"
#include "refiner/model/value.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

// ============================================================================
// Side Channel
// ============================================================================

/**
 * Preserved subtrees captured during extraction, keyed by canonical path.
 *
 * Filled exactly when the extractor writes a placeholder; read back by the
 * value encoder to inline the original expression wherever a placeholder
 * reappears in a replacement value.
 */
class PreservedExpressions
{
public:
  void record(const PropertyPath & path, Expr * expr);

  /// Expression captured for a placeholder's path, or nullptr.
  [[nodiscard]] Expr * resolve(const Value & ref) const;

  [[nodiscard]] size_t size() const noexcept { return by_path_key_.size(); }
  [[nodiscard]] bool empty() const noexcept { return by_path_key_.empty(); }

private:
  std::unordered_map<std::string, Expr *> by_path_key_;
};

// ============================================================================
// Extraction
// ============================================================================

struct ExtractOptions
{
  PreservedKeySet preserved_keys = {"children"};

  /// Receives every preserved subtree. May be null.
  PreservedExpressions * preserved_expressions = nullptr;
};

/**
 * Decode `expr` into plain data.
 *
 * Arrays are strict: a spread or an element that does not resolve makes the
 * whole array non-static, while holes are kept as holes. Objects are
 * partial: spreads, dynamic keys and unresolvable values are dropped and
 * the object itself always resolves. A keyed slot named by a preserved key
 * is not decoded; its expression goes to the side channel and a placeholder
 * carrying the slot path takes its place.
 *
 * @param path Logical path of `expr` from the props root
 * @return nullopt when the value is not static
 */
[[nodiscard]] std::optional<Value> extract_static_value(
  Expr * expr, const ExtractOptions & options, const PropertyPath & path = {});

/**
 * Root adapter: decode the props argument of a call site.
 *
 * @return nullopt unless the result is a keyed container
 */
[[nodiscard]] std::optional<Value> extract_static_props(
  Expr * props, const ExtractOptions & options);

}  // namespace refiner

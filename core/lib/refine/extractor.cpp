// refiner/refine/extractor.cpp - Decode expression subtrees into plain data
#include "refiner/refine/extractor.hpp"

#include <utility>

#include "refiner/refine/key_extractor.hpp"
#include "refiner/refine/static_resolver.hpp"

namespace refiner
{

// ============================================================================
// PreservedExpressions
// ============================================================================

void PreservedExpressions::record(const PropertyPath & path, Expr * expr)
{
  by_path_key_[stringify_property_path(path)] = expr;
}

Expr * PreservedExpressions::resolve(const Value & ref) const
{
  if (!ref.is_expression_ref()) return nullptr;
  const auto it = by_path_key_.find(stringify_property_path(ref.expression_ref_path()));
  return it == by_path_key_.end() ? nullptr : it->second;
}

// ============================================================================
// Extraction
// ============================================================================

namespace
{

class StaticExtractor
{
public:
  StaticExtractor(const ExtractOptions & options, PropertyPath path)
  : options_(options), path_(std::move(path))
  {
  }

  std::optional<Value> extract(Expr * expr)
  {
    if (auto leaf = try_resolve_static_value(expr)) return leaf;

    if (auto * arr = dyn_cast<ArrayExpr>(expr)) return extract_array(arr);
    if (auto * obj = dyn_cast<ObjectExpr>(expr)) return extract_object(obj);
    return std::nullopt;
  }

private:
  const ExtractOptions & options_;
  PropertyPath path_;  ///< Path of the node being extracted

  /// Strict: any non-static element collapses the whole array.
  std::optional<Value> extract_array(ArrayExpr * arr)
  {
    auto data = std::make_shared<ArrayData>();
    data->elements.reserve(arr->elements.size());

    for (size_t index = 0; index < arr->elements.size(); ++index) {
      Expr * element = arr->elements[index];
      if (!element) {
        data->elements.emplace_back(std::nullopt);
        continue;
      }
      if (isa<SpreadElement>(element)) return std::nullopt;

      path_.push_back(index_segment(index));
      auto value = extract(element);
      path_.pop_back();

      if (!value) return std::nullopt;
      data->elements.emplace_back(std::move(*value));
    }
    return Value::make_array(std::move(data));
  }

  /// Partial: unresolvable slots are omitted, the object always resolves.
  Value extract_object(ObjectExpr * obj)
  {
    auto data = std::make_shared<ObjectData>();

    for (AstNode * entry : obj->properties) {
      auto * prop = dyn_cast<Property>(entry);
      if (!prop) continue;  // spread

      auto key = extract_property_key(prop);
      if (!key) continue;

      path_.push_back(key_segment(*key));

      if (is_key_preserved(*key, options_.preserved_keys)) {
        if (options_.preserved_expressions && prop->value) {
          options_.preserved_expressions->record(path_, prop->value);
        }
        data->set(*key, Value::make_expression_ref(path_));
        path_.pop_back();
        continue;
      }

      auto value = extract(prop->value);
      path_.pop_back();

      if (value) data->set(std::move(*key), std::move(*value));
    }
    return Value::make_object(std::move(data));
  }
};

}  // namespace

std::optional<Value> extract_static_value(
  Expr * expr, const ExtractOptions & options, const PropertyPath & path)
{
  if (!expr) return std::nullopt;
  StaticExtractor extractor(options, path);
  return extractor.extract(expr);
}

std::optional<Value> extract_static_props(Expr * props, const ExtractOptions & options)
{
  auto extracted = extract_static_value(props, options);
  if (!extracted || !extracted->is_object()) return std::nullopt;
  return extracted;
}

}  // namespace refiner

// refiner/refine/tree_patcher.cpp - Apply property patches to an expression tree
#include "refiner/refine/tree_patcher.hpp"

#include <unordered_map>
#include <unordered_set>

#include "refiner/refine/key_extractor.hpp"

namespace refiner
{

namespace
{

/**
 * Logical path of the slot being visited.
 *
 * Each frame links to its parent. A frame pushed for a dynamic key has no
 * segment, so no path can be rebuilt for it or anything below it.
 */
class PathCursor
{
public:
  void push(std::optional<PathSegment> segment)
  {
    const size_t parent = frames_.empty() ? k_no_parent : frames_.size() - 1;
    frames_.push_back({std::move(segment), parent});
  }

  void pop() { frames_.pop_back(); }

  [[nodiscard]] std::optional<PropertyPath> current_path() const
  {
    PropertyPath reversed;
    size_t index = frames_.empty() ? k_no_parent : frames_.size() - 1;
    while (index != k_no_parent) {
      const Frame & frame = frames_[index];
      if (!frame.segment) return std::nullopt;
      reversed.push_back(*frame.segment);
      index = frame.parent;
    }
    return PropertyPath(reversed.rbegin(), reversed.rend());
  }

private:
  static constexpr size_t k_no_parent = static_cast<size_t>(-1);

  struct Frame
  {
    std::optional<PathSegment> segment;
    size_t parent;
  };

  std::vector<Frame> frames_;
};

/// Pending patches by canonical path key.
class PatchIndex
{
public:
  explicit PatchIndex(const std::vector<PropertyPatch> & patches)
  {
    for (const auto & patch : patches) {
      std::string key = stringify_property_path(patch.path);
      if (patch.operation == PatchOperation::Set) {
        if (sets_.find(key) == sets_.end()) set_order_.push_back(key);
        sets_[key] = &patch;
      } else {
        if (deletes_.insert(key).second) delete_order_.push_back(key);
      }
    }
  }

  [[nodiscard]] bool empty() const noexcept { return sets_.empty() && deletes_.empty(); }

  /// Remove and return the pending delete for `key`.
  bool take_delete(const std::string & key) { return deletes_.erase(key) > 0; }

  /// Remove and return the pending set for `key`, or nullptr.
  const PropertyPatch * take_set(const std::string & key)
  {
    const auto it = sets_.find(key);
    if (it == sets_.end()) return nullptr;
    const PropertyPatch * patch = it->second;
    sets_.erase(it);
    return patch;
  }

  [[nodiscard]] ApplyPatchesResult finish() const
  {
    ApplyPatchesResult result;
    for (const auto & key : set_order_) {
      if (sets_.count(key)) result.remaining_set_path_keys.push_back(key);
    }
    for (const auto & key : delete_order_) {
      if (deletes_.count(key)) result.remaining_delete_path_keys.push_back(key);
    }
    result.remaining_set_count = result.remaining_set_path_keys.size();
    result.remaining_delete_count = result.remaining_delete_path_keys.size();
    if (!result.remaining_set_path_keys.empty()) {
      result.first_unapplied_path_key = result.remaining_set_path_keys.front();
    } else if (!result.remaining_delete_path_keys.empty()) {
      result.first_unapplied_path_key = result.remaining_delete_path_keys.front();
    }
    return result;
  }

private:
  std::unordered_map<std::string, const PropertyPatch *> sets_;
  std::unordered_set<std::string> deletes_;
  std::vector<std::string> set_order_;
  std::vector<std::string> delete_order_;
};

class TreePatcher
{
public:
  TreePatcher(
    AstContext & ast, PatchIndex & index, const PreservedKeySet & preserved_keys,
    const ExpressionRefResolver & resolver)
  : ast_(ast), index_(index), preserved_keys_(preserved_keys), resolver_(resolver)
  {
  }

  void visit(Expr * expr)
  {
    if (index_.empty() || !expr) return;
    if (auto * obj = dyn_cast<ObjectExpr>(expr)) {
      visit_object(obj);
    } else if (auto * arr = dyn_cast<ArrayExpr>(expr)) {
      visit_array(arr);
    }
  }

private:
  AstContext & ast_;
  PatchIndex & index_;
  const PreservedKeySet & preserved_keys_;
  const ExpressionRefResolver & resolver_;
  PathCursor cursor_;

  /// Canonical key of the current slot, or nullopt when it is unaddressable.
  std::optional<std::string> current_key() const
  {
    auto path = cursor_.current_path();
    if (!path) return std::nullopt;
    return stringify_property_path(*path);
  }

  void visit_object(ObjectExpr * obj)
  {
    size_t i = 0;
    while (i < obj->properties.size()) {
      auto * prop = dyn_cast<Property>(obj->properties[i]);
      if (!prop) {
        ++i;
        continue;
      }

      auto key = extract_property_key(prop);
      if (key && is_key_preserved(*key, preserved_keys_)) {
        ++i;
        continue;
      }

      cursor_.push(key ? std::optional<PathSegment>(key_segment(*key)) : std::nullopt);
      if (auto path_key = current_key()) {
        if (index_.take_delete(*path_key)) {
          obj->erase_property(i);
          cursor_.pop();
          continue;
        }
        if (const PropertyPatch * patch = index_.take_set(*path_key)) {
          prop->value = encode_value(ast_, patch->value, resolver_);
          prop->shorthand = false;
        }
      }
      visit(prop->value);
      cursor_.pop();
      ++i;
    }
  }

  void visit_array(ArrayExpr * arr)
  {
    for (size_t i = 0; i < arr->elements.size(); ++i) {
      cursor_.push(index_segment(i));
      if (auto path_key = current_key()) {
        if (index_.take_delete(*path_key)) {
          arr->elements[i] = nullptr;
          cursor_.pop();
          continue;
        }
        if (const PropertyPatch * patch = index_.take_set(*path_key)) {
          arr->elements[i] = encode_value(ast_, patch->value, resolver_);
        }
      }
      Expr * element = arr->elements[i];
      if (element && !isa<SpreadElement>(element)) visit(element);
      cursor_.pop();
    }
  }
};

}  // namespace

ApplyPatchesResult apply_patches(
  AstContext & ast, Expr * root, const std::vector<PropertyPatch> & patches,
  const PreservedKeySet & preserved_keys, const ExpressionRefResolver & resolver)
{
  PatchIndex index(patches);
  if (auto * obj = dyn_cast<ObjectExpr>(root)) {
    TreePatcher patcher(ast, index, preserved_keys, resolver);
    patcher.visit(obj);
  }
  return index.finish();
}

}  // namespace refiner

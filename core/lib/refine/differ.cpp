// refiner/refine/differ.cpp - Structural differ for plain data trees
#include "refiner/refine/differ.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include "refiner/basic/js_format.hpp"

namespace refiner
{

namespace
{

/// Own enumerable properties: object entries, or present array elements.
template <typename Fn>
void for_each_own_property(const Value & container, Fn && fn)
{
  if (container.is_object()) {
    for (const auto & [key, value] : *container.object()) {
      fn(key, value);
    }
    return;
  }
  if (container.is_array()) {
    const auto & elements = container.array()->elements;
    for (size_t i = 0; i < elements.size(); ++i) {
      if (elements[i]) fn(std::to_string(i), *elements[i]);
    }
  }
}

/// `container[key]` when `key in container`, otherwise nullptr.
const Value * find_own_property(const Value & container, const std::string & key)
{
  if (container.is_object()) return container.object()->find(key);
  if (container.is_array() && is_array_index_key(key)) {
    const auto index = static_cast<size_t>(std::strtoull(key.c_str(), nullptr, 10));
    const auto & array = *container.array();
    return array.has_index(index) ? &*array.elements[index] : nullptr;
  }
  return nullptr;
}

PathSegment make_segment(const std::string & key, bool container_is_array)
{
  if (container_is_array) return std::strtod(key.c_str(), nullptr);
  return key;
}

bool arrays_shallow_equal(const ArrayData & a, const ArrayData & b)
{
  if (&a == &b) return true;
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    const auto & x = a.elements[i];
    const auto & y = b.elements[i];
    // A hole reads as undefined.
    const Value & xv = x ? *x : Value{};
    const Value & yv = y ? *y : Value{};
    if (!same_value(xv, yv)) return false;
  }
  return true;
}

DiffEvent make_create(PropertyPath path, const Value & value)
{
  return {DiffType::Create, std::move(path), value, Value{}};
}

DiffEvent make_remove(PropertyPath path, const Value & old_value)
{
  return {DiffType::Remove, std::move(path), Value{}, old_value};
}

DiffEvent make_change(PropertyPath path, const Value & value, const Value & old_value)
{
  return {DiffType::Change, std::move(path), value, old_value};
}

class StructuralDiffer
{
public:
  explicit StructuralDiffer(const DiffOptions & options) : options_(options) {}

  std::vector<DiffEvent> compare(const Value & previous, const Value & current)
  {
    if (previous.is_array() && current.is_array()) {
      switch (options_.arrays) {
        case ArrayStrategy::Ignore:
          return {};
        case ArrayStrategy::Atomic:
          if (atomic_arrays_equal(previous, current)) return {};
          return {make_change({}, current, previous)};
        case ArrayStrategy::Diff:
          break;
      }
    }
    return compare_children(previous, current);
  }

private:
  struct CycleEntry
  {
    const void * previous;
    const void * current;
  };

  const DiffOptions & options_;
  std::vector<CycleEntry> cycle_stack_;  ///< Container pairs on the current branch

  bool atomic_arrays_equal(const Value & previous, const Value & current) const
  {
    if (options_.array_equality == ArrayEquality::Reference) {
      return previous.identity() == current.identity();
    }
    return arrays_shallow_equal(*previous.array(), *current.array());
  }

  bool should_skip_key(const std::string & key, bool container_is_array) const
  {
    if (container_is_array) return false;
    const auto & skip = options_.keys_to_skip;
    return std::find(skip.begin(), skip.end(), key) != skip.end();
  }

  bool is_cycle(const Value & previous, const Value & current) const
  {
    for (const auto & entry : cycle_stack_) {
      if (entry.previous == previous.identity() && entry.current == current.identity()) {
        return true;
      }
    }
    return false;
  }

  std::vector<DiffEvent> recurse(const Value & previous, const Value & current)
  {
    if (!options_.track_circular_references) return compare(previous, current);

    cycle_stack_.push_back({previous.identity(), current.identity()});
    auto events = compare(previous, current);
    cycle_stack_.pop_back();
    return events;
  }

  std::vector<DiffEvent> compare_children(const Value & previous, const Value & current)
  {
    std::vector<DiffEvent> events;
    const bool previous_is_array = previous.is_array();
    const bool current_is_array = current.is_array();

    // Pass 1: removals and changes, in the previous container's key order.
    for_each_own_property(previous, [&](const std::string & key, const Value & previous_value) {
      if (should_skip_key(key, previous_is_array)) return;

      PathSegment segment = make_segment(key, previous_is_array);
      const Value * current_value = find_own_property(current, key);
      if (!current_value) {
        events.push_back(make_remove({std::move(segment)}, previous_value));
        return;
      }

      if (
        previous_value.is_container() && current_value->is_container() &&
        previous_value.is_array() == current_value->is_array()) {
        if (options_.track_circular_references && is_cycle(previous_value, *current_value)) {
          return;
        }
        if (!previous_value.is_rich()) {
          auto child_events = recurse(previous_value, *current_value);
          for (auto & event : child_events) {
            event.path.insert(event.path.begin(), segment);
            events.push_back(std::move(event));
          }
          return;
        }
      }

      const bool mismatch = !same_value(previous_value, *current_value);
      const bool rich_equal = previous_value.is_container() && current_value->is_container() &&
                              rich_values_equal(previous_value, *current_value);
      if (mismatch && !rich_equal) {
        events.push_back(make_change({std::move(segment)}, *current_value, previous_value));
      }
    });

    // Pass 2: creations, in the current container's key order.
    for_each_own_property(current, [&](const std::string & key, const Value & current_value) {
      if (should_skip_key(key, current_is_array)) return;
      if (find_own_property(previous, key)) return;
      events.push_back(make_create({make_segment(key, current_is_array)}, current_value));
    });

    return events;
  }
};

}  // namespace

std::vector<DiffEvent> diff(
  const Value & previous, const Value & current, const DiffOptions & options)
{
  StructuralDiffer differ(options);
  return differ.compare(previous, current);
}

}  // namespace refiner

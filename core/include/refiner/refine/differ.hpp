// refiner/refine/differ.hpp - Structural differ for plain data trees
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "refiner/model/value.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

enum class DiffType : uint8_t {
  Create,
  Remove,
  Change,
};

[[nodiscard]] constexpr std::string_view to_string(DiffType type)
{
  switch (type) {
    case DiffType::Create:
      return "CREATE";
    case DiffType::Remove:
      return "REMOVE";
    case DiffType::Change:
      return "CHANGE";
  }
  return "UNKNOWN";
}

/// How ordered containers are compared.
enum class ArrayStrategy : uint8_t {
  Ignore,  ///< Never recurse, never emit
  Atomic,  ///< Never recurse; one CHANGE for the whole array when unequal
  Diff,    ///< Recurse index by index, like keyed containers
};

/// Equality used by ArrayStrategy::Atomic.
enum class ArrayEquality : uint8_t {
  Reference,  ///< Same shared array
  Shallow,    ///< Same length and `same_value` element by element
};

struct DiffOptions
{
  bool track_circular_references = true;
  ArrayStrategy arrays = ArrayStrategy::Atomic;
  ArrayEquality array_equality = ArrayEquality::Reference;

  /// Keyed-container keys skipped entirely. Array indices are never skipped.
  std::vector<std::string> keys_to_skip;
};

/**
 * One difference between two trees.
 *
 * `value` is set for Create and Change, `old_value` for Remove and Change.
 */
struct DiffEvent
{
  DiffType type;
  PropertyPath path;
  Value value;
  Value old_value;
};

/**
 * Compare two containers and list their differences.
 *
 * Per level, the previous container's keys are visited first (REMOVE for
 * keys gone from `current`, recursion or CHANGE otherwise), then the
 * current container's keys (CREATE for new keys). Two values recurse only
 * when both are containers of the same array-ness; rich values (dates,
 * regexps, boxed primitives, placeholders) compare by content. With cycle
 * tracking, a container pair already being compared on the current branch
 * produces nothing.
 *
 * @code
 *   diff({a:1, b:2}, {b:3, c:4})
 *   // REMOVE a=1, CHANGE b 2->3, CREATE c=4
 * @endcode
 */
[[nodiscard]] std::vector<DiffEvent> diff(
  const Value & previous, const Value & current, const DiffOptions & options = {});

}  // namespace refiner

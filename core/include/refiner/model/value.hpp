// refiner/model/value.hpp - Plain data extracted from and written back to the tree
//
// Value mirrors the JavaScript data universe that static props can hold:
// primitives, keyed containers (objects), ordered containers (arrays with
// holes), a few rich built-ins, and preserved-subtree placeholders.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "refiner/refine/property_path.hpp"

namespace refiner
{

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  Undefined,
  Null,
  Bool,
  Number,
  BigInt,
  String,
  RegExp,         ///< /source/flags
  Date,           ///< Time value in milliseconds since the epoch
  Boxed,          ///< new Number(..), new String(..), new Boolean(..), Object(1n)
  Object,         ///< Keyed container
  Array,          ///< Ordered container
  ExpressionRef,  ///< Preserved-subtree placeholder
  Opaque,         ///< Host value with no literal form (functions, symbols)
};

[[nodiscard]] constexpr std::string_view to_string(ValueKind kind)
{
  switch (kind) {
    case ValueKind::Undefined:
      return "undefined";
    case ValueKind::Null:
      return "null";
    case ValueKind::Bool:
      return "boolean";
    case ValueKind::Number:
      return "number";
    case ValueKind::BigInt:
      return "bigint";
    case ValueKind::String:
      return "string";
    case ValueKind::RegExp:
      return "regexp";
    case ValueKind::Date:
      return "date";
    case ValueKind::Boxed:
      return "boxed";
    case ValueKind::Object:
      return "object";
    case ValueKind::Array:
      return "array";
    case ValueKind::ExpressionRef:
      return "expression-ref";
    case ValueKind::Opaque:
      return "opaque";
  }
  return "unknown";
}

/// Registry string that brands preserved-subtree placeholders. Recognition
/// compares this text, so placeholders made by any copy of the library match.
inline constexpr std::string_view k_expression_ref_brand = "refiner.preservation.expression_ref";

class ObjectData;
struct ArrayData;
struct RichData;

using ObjectPtr = std::shared_ptr<ObjectData>;
using ArrayPtr = std::shared_ptr<ArrayData>;

// ============================================================================
// Value
// ============================================================================

/**
 * One JavaScript value.
 *
 * Containers are shared: copying a Value that holds an object or array
 * copies the handle, not the contents, so identity (`same_value`) behaves
 * like JavaScript reference identity. Rich values (regexp, date, boxed,
 * placeholders) are immutable and shared the same way.
 *
 * A default-constructed Value is `undefined`.
 */
class Value
{
public:
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_undefined() { return {}; }
  static Value make_null();
  static Value make_bool(bool value);
  static Value make_number(double value);

  /// `digits` is canonical decimal text with an optional leading '-'.
  static Value make_bigint(std::string digits);
  static Value make_string(std::string value);
  static Value make_regexp(std::string source, std::string flags);
  static Value make_date(double time_ms);

  /// Wrap a primitive (bool, number, string or bigint).
  static Value make_boxed(const Value & primitive);

  /// Object holding `data`, or a fresh empty object when `data` is null.
  static Value make_object(ObjectPtr data = nullptr);

  /// Array holding `data`, or a fresh empty array when `data` is null.
  static Value make_array(ArrayPtr data = nullptr);

  static Value make_expression_ref(PropertyPath path);
  static Value make_opaque(std::string description);

  /// Fresh object with `entries` inserted in order.
  static Value object_of(std::initializer_list<std::pair<std::string, Value>> entries);

  /// Fresh dense array of `elements`.
  static Value array_of(std::initializer_list<Value> elements);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_undefined() const noexcept { return kind_ == ValueKind::Undefined; }
  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }
  [[nodiscard]] bool is_number() const noexcept { return kind_ == ValueKind::Number; }
  [[nodiscard]] bool is_bigint() const noexcept { return kind_ == ValueKind::BigInt; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_regexp() const noexcept { return kind_ == ValueKind::RegExp; }
  [[nodiscard]] bool is_date() const noexcept { return kind_ == ValueKind::Date; }
  [[nodiscard]] bool is_boxed() const noexcept { return kind_ == ValueKind::Boxed; }
  [[nodiscard]] bool is_object() const noexcept { return kind_ == ValueKind::Object; }
  [[nodiscard]] bool is_array() const noexcept { return kind_ == ValueKind::Array; }
  [[nodiscard]] bool is_opaque() const noexcept { return kind_ == ValueKind::Opaque; }

  /// True for a placeholder carrying the expression-ref brand.
  [[nodiscard]] bool is_expression_ref() const noexcept;

  /// True for anything `typeof` would call "object" (excluding null).
  [[nodiscard]] bool is_container() const noexcept;

  /// Containers compared by content instead of being traversed.
  [[nodiscard]] bool is_rich() const noexcept;

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Only valid if is_bool()
  [[nodiscard]] bool as_bool() const noexcept { return bool_; }

  /// Only valid if is_number()
  [[nodiscard]] double as_number() const noexcept { return number_; }

  /// String contents, BigInt digits, or the opaque description.
  [[nodiscard]] const std::string & as_string() const noexcept { return text_; }

  [[nodiscard]] const std::string & regexp_source() const;
  [[nodiscard]] const std::string & regexp_flags() const;
  [[nodiscard]] double date_time() const;
  [[nodiscard]] const Value & boxed_value() const;
  [[nodiscard]] const PropertyPath & expression_ref_path() const;
  [[nodiscard]] std::string_view brand() const;

  /// Only valid if is_object()
  [[nodiscard]] const ObjectPtr & object() const noexcept { return object_; }

  /// Only valid if is_array()
  [[nodiscard]] const ArrayPtr & array() const noexcept { return array_; }

  /// Address identifying a shared container or rich value; nullptr for primitives.
  [[nodiscard]] const void * identity() const noexcept;

private:
  ValueKind kind_ = ValueKind::Undefined;
  bool bool_ = false;
  double number_ = 0.0;
  std::string text_;
  ObjectPtr object_;
  ArrayPtr array_;
  std::shared_ptr<const RichData> rich_;
};

// ============================================================================
// Containers
// ============================================================================

/**
 * Keyed container with JavaScript own-property order: canonical array-index
 * keys first in ascending numeric order, then other keys in insertion order.
 */
class ObjectData
{
public:
  using Entry = std::pair<std::string, Value>;

  [[nodiscard]] bool has(std::string_view key) const { return find(key) != nullptr; }
  [[nodiscard]] const Value * find(std::string_view key) const;
  [[nodiscard]] Value * find(std::string_view key);

  /// Insert or overwrite. Overwriting keeps the key's position.
  void set(std::string key, Value value);

  /// Remove `key`; false when absent.
  bool erase(std::string_view key);

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

private:
  std::vector<Entry> entries_;
};

/// Ordered container. A nullopt element is a hole and not an own key.
struct ArrayData
{
  std::vector<std::optional<Value>> elements;

  [[nodiscard]] size_t size() const noexcept { return elements.size(); }
  [[nodiscard]] bool has_index(size_t index) const noexcept
  {
    return index < elements.size() && elements[index].has_value();
  }
};

// ============================================================================
// Comparison and Text
// ============================================================================

/// `Object.is`: NaN equals NaN, +0 differs from -0, containers by identity.
[[nodiscard]] bool same_value(const Value & a, const Value & b);

/**
 * Content equality for rich values of the same kind.
 *
 * Boxed numbers treat NaN as equal to NaN; dates compare time values;
 * regexps compare `/source/flags`; placeholders compare paths.
 */
[[nodiscard]] bool rich_values_equal(const Value & a, const Value & b);

/// `String(value)`.
[[nodiscard]] std::string to_js_string(const Value & value);

/// Compact debug rendering, e.g. `{"a":1,"b":[1,,"x"]}`. Cycles print as `[Circular]`.
[[nodiscard]] std::string to_display_string(const Value & value);

}  // namespace refiner

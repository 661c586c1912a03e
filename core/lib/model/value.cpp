// refiner/model/value.cpp - Plain data extracted from and written back to the tree
//
#include "refiner/model/value.hpp"

#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <stdexcept>
#include <unordered_set>

#include "refiner/basic/js_format.hpp"

namespace refiner
{

/// Payload of rich values. Immutable once built.
struct RichData
{
  std::string source;  ///< RegExp source
  std::string flags;   ///< RegExp flags
  double time = 0.0;   ///< Date time value
  std::optional<Value> boxed;
  PropertyPath path;   ///< ExpressionRef path
  std::string_view brand;
};

// ============================================================================
// Factory Methods
// ============================================================================

Value Value::make_null()
{
  Value v;
  v.kind_ = ValueKind::Null;
  return v;
}

Value Value::make_bool(bool value)
{
  Value v;
  v.kind_ = ValueKind::Bool;
  v.bool_ = value;
  return v;
}

Value Value::make_number(double value)
{
  Value v;
  v.kind_ = ValueKind::Number;
  v.number_ = value;
  return v;
}

Value Value::make_bigint(std::string digits)
{
  Value v;
  v.kind_ = ValueKind::BigInt;
  v.text_ = std::move(digits);
  return v;
}

Value Value::make_string(std::string value)
{
  Value v;
  v.kind_ = ValueKind::String;
  v.text_ = std::move(value);
  return v;
}

Value Value::make_regexp(std::string source, std::string flags)
{
  auto rich = std::make_shared<RichData>();
  rich->source = std::move(source);
  rich->flags = std::move(flags);

  Value v;
  v.kind_ = ValueKind::RegExp;
  v.rich_ = std::move(rich);
  return v;
}

Value Value::make_date(double time_ms)
{
  auto rich = std::make_shared<RichData>();
  rich->time = time_ms;

  Value v;
  v.kind_ = ValueKind::Date;
  v.rich_ = std::move(rich);
  return v;
}

Value Value::make_boxed(const Value & primitive)
{
  switch (primitive.kind()) {
    case ValueKind::Bool:
    case ValueKind::Number:
    case ValueKind::String:
    case ValueKind::BigInt:
      break;
    default:
      throw std::invalid_argument(
        fmt::format("cannot box a value of kind '{}'", to_string(primitive.kind())));
  }

  auto rich = std::make_shared<RichData>();
  rich->boxed = primitive;

  Value v;
  v.kind_ = ValueKind::Boxed;
  v.rich_ = std::move(rich);
  return v;
}

Value Value::make_object(ObjectPtr data)
{
  Value v;
  v.kind_ = ValueKind::Object;
  v.object_ = data ? std::move(data) : std::make_shared<ObjectData>();
  return v;
}

Value Value::make_array(ArrayPtr data)
{
  Value v;
  v.kind_ = ValueKind::Array;
  v.array_ = data ? std::move(data) : std::make_shared<ArrayData>();
  return v;
}

Value Value::make_expression_ref(PropertyPath path)
{
  auto rich = std::make_shared<RichData>();
  rich->path = std::move(path);
  rich->brand = k_expression_ref_brand;

  Value v;
  v.kind_ = ValueKind::ExpressionRef;
  v.rich_ = std::move(rich);
  return v;
}

Value Value::make_opaque(std::string description)
{
  Value v;
  v.kind_ = ValueKind::Opaque;
  v.text_ = std::move(description);
  // Identity only; opaque values carry no content.
  v.rich_ = std::make_shared<RichData>();
  return v;
}

Value Value::object_of(std::initializer_list<std::pair<std::string, Value>> entries)
{
  auto data = std::make_shared<ObjectData>();
  for (const auto & [key, value] : entries) {
    data->set(key, value);
  }
  return make_object(std::move(data));
}

Value Value::array_of(std::initializer_list<Value> elements)
{
  auto data = std::make_shared<ArrayData>();
  data->elements.reserve(elements.size());
  for (const auto & element : elements) {
    data->elements.emplace_back(element);
  }
  return make_array(std::move(data));
}

// ============================================================================
// Queries and Accessors
// ============================================================================

bool Value::is_expression_ref() const noexcept
{
  return kind_ == ValueKind::ExpressionRef && rich_ && rich_->brand == k_expression_ref_brand;
}

bool Value::is_container() const noexcept
{
  switch (kind_) {
    case ValueKind::Object:
    case ValueKind::Array:
    case ValueKind::RegExp:
    case ValueKind::Date:
    case ValueKind::Boxed:
    case ValueKind::ExpressionRef:
      return true;
    default:
      return false;
  }
}

bool Value::is_rich() const noexcept
{
  switch (kind_) {
    case ValueKind::RegExp:
    case ValueKind::Date:
    case ValueKind::Boxed:
    case ValueKind::ExpressionRef:
      return true;
    default:
      return false;
  }
}

const std::string & Value::regexp_source() const
{
  if (!is_regexp()) throw std::logic_error("regexp_source() on a non-regexp value");
  return rich_->source;
}

const std::string & Value::regexp_flags() const
{
  if (!is_regexp()) throw std::logic_error("regexp_flags() on a non-regexp value");
  return rich_->flags;
}

double Value::date_time() const
{
  if (!is_date()) throw std::logic_error("date_time() on a non-date value");
  return rich_->time;
}

const Value & Value::boxed_value() const
{
  if (!is_boxed()) throw std::logic_error("boxed_value() on an unboxed value");
  return *rich_->boxed;
}

const PropertyPath & Value::expression_ref_path() const
{
  if (kind_ != ValueKind::ExpressionRef) {
    throw std::logic_error("expression_ref_path() on a non-placeholder value");
  }
  return rich_->path;
}

std::string_view Value::brand() const { return rich_ ? rich_->brand : std::string_view{}; }

const void * Value::identity() const noexcept
{
  if (object_) return object_.get();
  if (array_) return array_.get();
  return rich_.get();
}

// ============================================================================
// ObjectData
// ============================================================================

const Value * ObjectData::find(std::string_view key) const
{
  for (const auto & entry : entries_) {
    if (entry.first == key) return &entry.second;
  }
  return nullptr;
}

Value * ObjectData::find(std::string_view key)
{
  for (auto & entry : entries_) {
    if (entry.first == key) return &entry.second;
  }
  return nullptr;
}

void ObjectData::set(std::string key, Value value)
{
  if (Value * existing = find(key)) {
    *existing = std::move(value);
    return;
  }

  if (!is_array_index_key(key)) {
    entries_.emplace_back(std::move(key), std::move(value));
    return;
  }

  // Index keys precede every other key, in ascending numeric order.
  const auto index = std::strtoull(key.c_str(), nullptr, 10);
  auto pos = entries_.begin();
  while (pos != entries_.end() && is_array_index_key(pos->first) &&
         std::strtoull(pos->first.c_str(), nullptr, 10) < index) {
    ++pos;
  }
  entries_.emplace(pos, std::move(key), std::move(value));
}

bool ObjectData::erase(std::string_view key)
{
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->first == key) {
      entries_.erase(it);
      return true;
    }
  }
  return false;
}

std::vector<std::string> ObjectData::keys() const
{
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto & entry : entries_) {
    out.push_back(entry.first);
  }
  return out;
}

// ============================================================================
// Comparison
// ============================================================================

bool same_value(const Value & a, const Value & b)
{
  if (a.kind() != b.kind()) return false;

  switch (a.kind()) {
    case ValueKind::Undefined:
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return a.as_bool() == b.as_bool();
    case ValueKind::Number: {
      const double x = a.as_number();
      const double y = b.as_number();
      if (std::isnan(x)) return std::isnan(y);
      return x == y && std::signbit(x) == std::signbit(y);
    }
    case ValueKind::BigInt:
    case ValueKind::String:
      return a.as_string() == b.as_string();
    default:
      return a.identity() == b.identity();
  }
}

namespace
{

bool strict_equals_primitive(const Value & a, const Value & b)
{
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case ValueKind::Bool:
      return a.as_bool() == b.as_bool();
    case ValueKind::Number:
      return a.as_number() == b.as_number();
    case ValueKind::BigInt:
    case ValueKind::String:
      return a.as_string() == b.as_string();
    default:
      return false;
  }
}

}  // namespace

bool rich_values_equal(const Value & a, const Value & b)
{
  if (a.kind() != b.kind()) return false;

  switch (a.kind()) {
    case ValueKind::Boxed: {
      const Value & x = a.boxed_value();
      const Value & y = b.boxed_value();
      if (x.is_number() && y.is_number() && std::isnan(x.as_number())) {
        return std::isnan(y.as_number());
      }
      return strict_equals_primitive(x, y);
    }
    case ValueKind::Date:
      return a.date_time() == b.date_time();
    case ValueKind::RegExp:
      return a.regexp_source() == b.regexp_source() && a.regexp_flags() == b.regexp_flags();
    case ValueKind::ExpressionRef:
      return a.is_expression_ref() && b.is_expression_ref() &&
             stringify_property_path(a.expression_ref_path()) ==
               stringify_property_path(b.expression_ref_path());
    default:
      return false;
  }
}

// ============================================================================
// Text
// ============================================================================

namespace
{

/// Date.prototype.toISOString, or "Invalid Date".
std::string format_iso_date(double time_ms)
{
  if (!std::isfinite(time_ms)) return "Invalid Date";

  const auto total_ms = static_cast<int64_t>(time_ms);
  int64_t days = total_ms / 86400000;
  int64_t ms_of_day = total_ms % 86400000;
  if (ms_of_day < 0) {
    ms_of_day += 86400000;
    --days;
  }

  // Civil date from days since 1970-01-01 (Howard Hinnant's algorithm).
  const int64_t z = days + 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t day = doy - (153 * mp + 2) / 5 + 1;
  const int64_t month = mp < 10 ? mp + 3 : mp - 9;
  const int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

  return fmt::format(
    "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", year, month, day, ms_of_day / 3600000,
    (ms_of_day / 60000) % 60, (ms_of_day / 1000) % 60, ms_of_day % 1000);
}

void append_js_string(std::string & out, const Value & value);

void append_array_join(std::string & out, const ArrayData & array)
{
  for (size_t i = 0; i < array.size(); ++i) {
    if (i > 0) out.push_back(',');
    const auto & element = array.elements[i];
    if (!element || element->is_undefined() || element->is_null()) continue;
    append_js_string(out, *element);
  }
}

void append_js_string(std::string & out, const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Undefined:
      out += "undefined";
      return;
    case ValueKind::Null:
      out += "null";
      return;
    case ValueKind::Bool:
      out += value.as_bool() ? "true" : "false";
      return;
    case ValueKind::Number:
      out += format_js_number(value.as_number());
      return;
    case ValueKind::BigInt:
    case ValueKind::String:
      out += value.as_string();
      return;
    case ValueKind::RegExp:
      out += "/" + value.regexp_source() + "/" + value.regexp_flags();
      return;
    case ValueKind::Date:
      out += format_iso_date(value.date_time());
      return;
    case ValueKind::Boxed:
      append_js_string(out, value.boxed_value());
      return;
    case ValueKind::Array:
      append_array_join(out, *value.array());
      return;
    case ValueKind::Object:
    case ValueKind::ExpressionRef:
      out += "[object Object]";
      return;
    case ValueKind::Opaque:
      out += value.as_string();
      return;
  }
}

class DisplayWriter
{
public:
  std::string out;

  void write(const Value & value)
  {
    switch (value.kind()) {
      case ValueKind::String:
        out += quote_js_string(value.as_string());
        return;
      case ValueKind::BigInt:
        out += value.as_string() + "n";
        return;
      case ValueKind::Date:
        out += fmt::format("Date({})", format_js_number(value.date_time()));
        return;
      case ValueKind::Boxed:
        out += "Boxed(";
        write(value.boxed_value());
        out += ")";
        return;
      case ValueKind::ExpressionRef:
        out += "ExpressionRef(" + stringify_property_path(value.expression_ref_path()) + ")";
        return;
      case ValueKind::Opaque:
        out += "<" + value.as_string() + ">";
        return;
      case ValueKind::Object:
        write_object(value);
        return;
      case ValueKind::Array:
        write_array(value);
        return;
      default:
        append_js_string(out, value);
        return;
    }
  }

private:
  std::unordered_set<const void *> active_;

  void write_object(const Value & value)
  {
    if (!active_.insert(value.identity()).second) {
      out += "[Circular]";
      return;
    }
    out += "{";
    bool first = true;
    for (const auto & [key, child] : *value.object()) {
      if (!first) out += ",";
      first = false;
      out += quote_js_string(key) + ":";
      write(child);
    }
    out += "}";
    active_.erase(value.identity());
  }

  void write_array(const Value & value)
  {
    if (!active_.insert(value.identity()).second) {
      out += "[Circular]";
      return;
    }
    const auto & elements = value.array()->elements;
    out += "[";
    for (size_t i = 0; i < elements.size(); ++i) {
      if (i > 0) out += ",";
      if (elements[i]) write(*elements[i]);
    }
    // A trailing hole needs its own comma to survive.
    if (!elements.empty() && !elements.back()) out += ",";
    out += "]";
    active_.erase(value.identity());
  }
};

}  // namespace

std::string to_js_string(const Value & value)
{
  std::string out;
  append_js_string(out, value);
  return out;
}

std::string to_display_string(const Value & value)
{
  DisplayWriter writer;
  writer.write(value);
  return writer.out;
}

}  // namespace refiner

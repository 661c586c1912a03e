// refiner/refine/property_path.cpp - Logical paths and their canonical string keys
//
#include "refiner/refine/property_path.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

#include "refiner/basic/js_format.hpp"

namespace refiner
{

namespace
{

/// Text of a numeric segment inside the canonical key. Non-finite values
/// map to quoted tokens so they cannot alias `null`.
std::string canonical_number(double value)
{
  if (std::isnan(value)) return quote_js_string("NaN");
  if (std::isinf(value)) return quote_js_string(value > 0 ? "Infinity" : "-Infinity");
  // format_js_number prints -0 as "0".
  return format_js_number(value);
}

}  // namespace

std::string stringify_property_path(const PropertyPath & path)
{
  std::string out = "[";
  bool first = true;
  for (const auto & segment : path) {
    if (!first) out.push_back(',');
    first = false;

    if (const auto * key = std::get_if<std::string>(&segment)) {
      out += quote_js_string(*key);
    } else {
      out += canonical_number(std::get<double>(segment));
    }
  }
  out.push_back(']');
  return out;
}

std::optional<PropertyPath> parse_property_path_key(std::string_view key)
{
  const auto parsed =
    nlohmann::json::parse(key.begin(), key.end(), nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_array()) return std::nullopt;

  PropertyPath path;
  path.reserve(parsed.size());
  for (const auto & item : parsed) {
    if (item.is_string()) {
      path.emplace_back(item.get<std::string>());
    } else if (item.is_number()) {
      path.emplace_back(item.get<double>());
    } else {
      return std::nullopt;
    }
  }
  return path;
}

std::string segment_to_string(const PathSegment & segment)
{
  if (const auto * key = std::get_if<std::string>(&segment)) return *key;
  return format_js_number(std::get<double>(segment));
}

std::string join_property_path(const PropertyPath & path, std::string_view separator)
{
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) out += separator;
    out += segment_to_string(path[i]);
  }
  return out;
}

std::string format_path_label(std::string_view base, const PropertyPath & path)
{
  std::string out(base);
  for (const auto & segment : path) {
    if (std::holds_alternative<double>(segment)) {
      out += "[" + segment_to_string(segment) + "]";
    } else {
      out += "." + std::get<std::string>(segment);
    }
  }
  return out;
}

bool is_key_preserved(const std::string & key, const PreservedKeySet & keys)
{
  return keys.count(key) > 0;
}

bool is_key_preserved(const PathSegment & segment, const PreservedKeySet & keys)
{
  return is_key_preserved(segment_to_string(segment), keys);
}

}  // namespace refiner

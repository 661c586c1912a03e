// refiner/project/project_config.cpp - Project configuration implementation
//
#include "refiner/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <memory>

#include "refiner/refine/error.hpp"
#include "refiner/refine/field_schema.hpp"
#include "refiner/refine/rule_validator.hpp"

namespace refiner
{

namespace
{

/// Convert a YAML node to a Value. Quoted scalars stay strings.
Value to_value(const YAML::Node & node)
{
  if (!node || node.IsNull()) return Value::make_null();

  if (node.IsSequence()) {
    auto data = std::make_shared<ArrayData>();
    for (const auto & item : node) {
      data->elements.emplace_back(to_value(item));
    }
    return Value::make_array(std::move(data));
  }

  if (node.IsMap()) {
    auto data = std::make_shared<ObjectData>();
    for (const auto & entry : node) {
      data->set(entry.first.as<std::string>(), to_value(entry.second));
    }
    return Value::make_object(std::move(data));
  }

  if (node.Tag() != "!") {
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return Value::make_bool(b);
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return Value::make_number(d);
  }
  return Value::make_string(node.Scalar());
}

/// Parse a list of strings
bool parse_string_list(
  const YAML::Node & node, std::vector<std::string> & out, const std::string & what,
  std::string & error)
{
  if (!node.IsSequence()) {
    error = what + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = what + " entries must be strings";
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Parse one field entry: either a type name or a map of settings
std::optional<FieldSpec> parse_field(const YAML::Node & node, std::string & error)
{
  FieldSpec spec;

  if (node.IsScalar()) {
    auto type = parse_field_type(node.as<std::string>());
    if (!type) {
      error = "unknown type '" + node.as<std::string>() + "'";
      return std::nullopt;
    }
    spec.type = *type;
    return spec;
  }

  if (!node.IsMap()) {
    error = "field entry must be a type name or a map";
    return std::nullopt;
  }

  if (node["type"]) {
    const auto name = node["type"].as<std::string>();
    auto type = parse_field_type(name);
    if (!type) {
      error = "unknown type '" + name + "' (must be one of any, string, number, boolean, "
              "array, object)";
      return std::nullopt;
    }
    spec.type = *type;
  }

  if (node["required"]) {
    spec.required = node["required"].as<bool>();
  }

  if (node["coerce"]) {
    spec.coerce = node["coerce"].as<bool>();
  }

  if (node["default"]) {
    spec.default_value = to_value(node["default"]);
  }

  return spec;
}

/// Parse one component rule
std::optional<ComponentRule> parse_rule(
  const std::string & component, const YAML::Node & node, std::string & error)
{
  ComponentRule rule;

  if (node.IsMap()) {
    if (node["schema"]) {
      const auto & schema_node = node["schema"];
      if (!schema_node.IsMap()) {
        error = "components." + component + ".schema must be a map";
        return std::nullopt;
      }
      auto schema = std::make_shared<FieldSchema>();
      for (const auto & entry : schema_node) {
        const auto field_name = entry.first.as<std::string>();
        std::string field_error;
        auto spec = parse_field(entry.second, field_error);
        if (!spec) {
          error = "components." + component + ".schema." + field_name + ": " + field_error;
          return std::nullopt;
        }
        schema->add_field(field_name, std::move(*spec));
      }
      rule.schema = std::move(schema);
    }

    if (node["prune_keys"]) {
      std::vector<std::string> keys;
      if (!parse_string_list(
            node["prune_keys"], keys, "components." + component + ".prune_keys", error)) {
        return std::nullopt;
      }
      rule.prune_keys = std::move(keys);
    }
  } else if (!node.IsNull()) {
    error = "components." + component + " must be a map";
    return std::nullopt;
  }

  try {
    validate_rule(&rule, component);
  } catch (const ConfigurationError & e) {
    error = e.what();
    return std::nullopt;
  }
  return rule;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    if (root["preserved_keys"]) {
      std::vector<std::string> keys;
      std::string error;
      if (!parse_string_list(root["preserved_keys"], keys, "preserved_keys", error)) {
        return ConfigLoadResult::fail(error);
      }
      config.options.preserved_keys = PreservedKeySet(keys.begin(), keys.end());
    }

    if (root["apply_transforms"]) {
      config.options.apply_transforms = root["apply_transforms"].as<bool>();
    }

    if (root["components"]) {
      const auto & components = root["components"];
      if (!components.IsMap()) {
        return ConfigLoadResult::fail("components must be a map");
      }
      for (const auto & entry : components) {
        const auto name = entry.first.as<std::string>();
        std::string error;
        auto rule = parse_rule(name, entry.second, error);
        if (!rule) {
          return ConfigLoadResult::fail("invalid rule: " + error);
        }
        config.rules.add(name, std::move(*rule));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  auto result = parse_root(root);
  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult parse_project_config(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace refiner

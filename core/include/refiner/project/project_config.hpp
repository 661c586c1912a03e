// refiner/project/project_config.hpp - Project configuration (refiner.yaml)
//
// Parses and validates refiner.yaml: pipeline options and the declarative
// component rule registry.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "refiner/refine/pipeline.hpp"
#include "refiner/refine/rule.hpp"

namespace refiner
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (refiner.yaml).
 */
struct ProjectConfig
{
  RefineOptions options;
  RuleRegistry rules;

  /// Directory containing refiner.yaml (empty when loaded from text)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a refiner.yaml file.
 *
 * @param config_path Path to refiner.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config() for in-memory YAML text.
[[nodiscard]] ConfigLoadResult parse_project_config(std::string_view yaml_text);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to refiner.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "refiner.yaml";

}  // namespace refiner

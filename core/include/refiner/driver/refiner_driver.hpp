// refiner/driver/refiner_driver.hpp - Refinement driver
//
// Single entry point for the parse / refine / print pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "refiner/basic/diagnostic.hpp"
#include "refiner/project/project_config.hpp"
#include "refiner/syntax/frontend.hpp"

namespace refiner
{

// ============================================================================
// Refine Mode
// ============================================================================

enum class RefineMode {
  Check,  ///< Extract and validate only; the module is never rewritten
  Build,  ///< Apply patches and print the refined module
};

// ============================================================================
// Driver Options
// ============================================================================

struct DriverOptions
{
  RefineMode mode = RefineMode::Build;

  /// Output file for Build mode; the text is only returned when unset
  std::optional<std::filesystem::path> output_file;

  /// Build without writing anything
  bool dry_run = false;

  /// Progress messages on stderr
  bool verbose = false;
};

// ============================================================================
// Refine Result
// ============================================================================

struct RefineResult
{
  /// Whether refinement succeeded (no errors)
  bool success = false;

  /// Parse and refinement diagnostics
  DiagnosticBag diagnostics;

  /// Parsed module; owns the source text the diagnostics point into
  std::unique_ptr<ParsedUnit> unit;

  /// Printed module (Build mode only)
  std::string output_text;

  /// Call sites whose props literal was rewritten
  size_t modified_call_sites = 0;

  /// Set when the output was written to disk
  std::optional<std::filesystem::path> written_file;
};

// ============================================================================
// Refiner
// ============================================================================

/**
 * Driver that runs one module through the pipeline.
 *
 * The pipeline consists of:
 * 1. Parsing (lexer + parser, syntax diagnostics)
 * 2. Call-site refinement with the configured rule registry
 * 3. Printing and writing the module (Build mode only)
 *
 * Refinement failures are turned into diagnostics on the failing call
 * site; the first failure ends refinement of the module.
 */
class Refiner
{
public:
  explicit Refiner(ProjectConfig config) : config_(std::move(config)) {}

  [[nodiscard]] const ProjectConfig & config() const noexcept { return config_; }

  /**
   * Refine a single source file.
   *
   * @param file Path to the module
   * @param options Driver options
   * @return RefineResult with success status and diagnostics
   */
  [[nodiscard]] RefineResult refine_file(
    const std::filesystem::path & file, const DriverOptions & options) const;

  /// Refine in-memory module text. Nothing is written unless output_file is set.
  [[nodiscard]] RefineResult refine_source(
    std::string source_text, const std::filesystem::path & display_path,
    const DriverOptions & options) const;

private:
  ProjectConfig config_;
};

}  // namespace refiner

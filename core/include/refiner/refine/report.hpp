// refiner/refine/report.hpp - Human-readable patch failure reports
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refiner/refine/patch.hpp"

namespace refiner
{

/// Phase that produced the patch at a canonical path key, if known.
using PhaseLookup = std::function<std::optional<PatchPhase>(const std::string & path_key)>;

struct PatchSummaryContext
{
  std::vector<std::string> remaining_set_path_keys;
  std::vector<std::string> remaining_delete_path_keys;
  int max_preview_paths = 5;  ///< 0 or less disables the preview
};

struct PatchReportOptions
{
  std::string component;
  PhaseLookup phase_of;
  PatchSummaryContext summary;
};

/// `["items",1,"id"]` becomes `items.1.id`; anything unparsable is returned as is.
[[nodiscard]] std::string format_path_key_for_display(std::string_view path_key);

/**
 * Multi-line failure message.
 *
 * Names the component and the first unapplied path with its phase, adds a
 * hint for derive patches, and ends with a summary of everything left:
 *
 *   Cannot fully apply patches for Card.
 *   First un-applied path: "meta.title" (phase: derive) (non-literal AST shape or missing path)
 *   Hint: derive patches are leaf-only. ...
 *   Summary: unapplied set=2 (derive=1, diff=1); preview: "meta.title" (derive), "x" (diff)
 */
[[nodiscard]] std::string format_patch_failure(
  const std::string & first_unapplied_path_key, const PatchReportOptions & options);

/// @throws PatchApplicationError carrying format_patch_failure()
[[noreturn]] void report_patch_failure(
  const std::string & first_unapplied_path_key, const PatchReportOptions & options);

}  // namespace refiner

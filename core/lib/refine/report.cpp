// refiner/refine/report.cpp - Human-readable patch failure reports
#include "refiner/refine/report.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <utility>

#include "refiner/refine/error.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

std::string format_path_key_for_display(std::string_view path_key)
{
  auto path = parse_property_path_key(path_key);
  if (path && !path->empty()) return join_property_path(*path);
  return std::string(path_key);
}

namespace
{

std::string phase_label(const PhaseLookup & phase_of, const std::string & key)
{
  const auto phase = phase_of ? phase_of(key) : std::nullopt;
  return phase ? std::string(to_string(*phase)) : std::string("unknown");
}

/// `diff=1, derive=2` in first-seen order.
std::string format_phase_distribution(
  const std::vector<std::string> & keys, const PhaseLookup & phase_of)
{
  std::vector<std::pair<std::string, size_t>> counts;
  for (const auto & key : keys) {
    const std::string label = phase_label(phase_of, key);
    bool found = false;
    for (auto & entry : counts) {
      if (entry.first == label) {
        ++entry.second;
        found = true;
        break;
      }
    }
    if (!found) counts.emplace_back(label, 1);
  }

  std::string out;
  for (const auto & [label, count] : counts) {
    if (!out.empty()) out += ", ";
    out += fmt::format("{}={}", label, count);
  }
  return out;
}

std::string format_path_preview(
  const std::vector<std::string> & keys, size_t limit, const PhaseLookup & phase_of)
{
  std::string out = "preview: ";
  const size_t shown = std::min(limit, keys.size());
  for (size_t i = 0; i < shown; ++i) {
    if (i > 0) out += ", ";
    out += fmt::format(
      "\"{}\" ({})", format_path_key_for_display(keys[i]), phase_label(phase_of, keys[i]));
  }
  if (keys.size() > limit) {
    out += fmt::format(", … ({} more)", keys.size() - limit);
  }
  return out;
}

std::optional<std::string> format_summary(
  const PatchSummaryContext & context, const PhaseLookup & phase_of)
{
  const auto & set_keys = context.remaining_set_path_keys;
  const auto & delete_keys = context.remaining_delete_path_keys;
  if (set_keys.empty() && delete_keys.empty()) return std::nullopt;

  std::string operations;
  if (!set_keys.empty()) {
    operations += fmt::format(
      "set={} ({})", set_keys.size(), format_phase_distribution(set_keys, phase_of));
  }
  if (!delete_keys.empty()) {
    if (!operations.empty()) operations += ", ";
    operations += fmt::format(
      "delete={} ({})", delete_keys.size(), format_phase_distribution(delete_keys, phase_of));
  }

  std::string summary = "Summary: unapplied " + operations;
  if (context.max_preview_paths > 0) {
    std::vector<std::string> all_keys = set_keys;
    all_keys.insert(all_keys.end(), delete_keys.begin(), delete_keys.end());
    summary += "; ";
    summary +=
      format_path_preview(all_keys, static_cast<size_t>(context.max_preview_paths), phase_of);
  }
  return summary;
}

}  // namespace

std::string format_patch_failure(
  const std::string & first_unapplied_path_key, const PatchReportOptions & options)
{
  const auto phase =
    options.phase_of ? options.phase_of(first_unapplied_path_key) : std::nullopt;
  const std::string annotation =
    phase ? fmt::format(" (phase: {})", to_string(*phase)) : std::string();

  std::string message = fmt::format("Cannot fully apply patches for {}.", options.component);
  message += fmt::format(
    "\nFirst un-applied path: \"{}\"{} (non-literal AST shape or missing path)",
    format_path_key_for_display(first_unapplied_path_key), annotation);

  if (phase == PatchPhase::Derive) {
    message +=
      "\nHint: derive patches are leaf-only. Ensure the prop exists in MDX "
      "(e.g. <CustomComponent test={...} />) before setting it.";
  }

  if (auto summary = format_summary(options.summary, options.phase_of)) {
    message += "\n" + *summary;
  }
  return message;
}

void report_patch_failure(
  const std::string & first_unapplied_path_key, const PatchReportOptions & options)
{
  const auto phase =
    options.phase_of ? options.phase_of(first_unapplied_path_key) : std::nullopt;
  throw PatchApplicationError(
    format_patch_failure(first_unapplied_path_key, options), first_unapplied_path_key, phase);
}

}  // namespace refiner

// test_report.cpp - Patch failure messages
//
#include <gtest/gtest.h>

#include <unordered_map>

#include "refiner/refine/error.hpp"
#include "refiner/refine/report.hpp"

namespace refiner
{

namespace
{

PhaseLookup lookup(std::unordered_map<std::string, PatchPhase> phases)
{
  return [phases = std::move(phases)](const std::string & key) -> std::optional<PatchPhase> {
    const auto it = phases.find(key);
    if (it == phases.end()) return std::nullopt;
    return it->second;
  };
}

}  // namespace

TEST(PatchReport, DisplayPathJoinsSegments)
{
  EXPECT_EQ(format_path_key_for_display(R"(["items",1,"id"])"), "items.1.id");
  EXPECT_EQ(format_path_key_for_display("not json"), "not json");
  EXPECT_EQ(format_path_key_for_display("[]"), "[]");
}

TEST(PatchReport, DiffFailureWithSummary)
{
  PatchReportOptions options;
  options.component = "Card";
  options.phase_of = lookup({{R"(["x"])", PatchPhase::Diff}});
  options.summary.remaining_set_path_keys = {R"(["x"])"};

  EXPECT_EQ(
    format_patch_failure(R"(["x"])", options),
    "Cannot fully apply patches for Card.\n"
    "First un-applied path: \"x\" (phase: diff) (non-literal AST shape or missing path)\n"
    "Summary: unapplied set=1 (diff=1); preview: \"x\" (diff)");
}

TEST(PatchReport, DeriveFailureAddsHint)
{
  PatchReportOptions options;
  options.component = "Card";
  options.phase_of = lookup({{R"(["meta","title"])", PatchPhase::Derive}});

  const std::string message = format_patch_failure(R"(["meta","title"])", options);
  EXPECT_NE(message.find("First un-applied path: \"meta.title\" (phase: derive)"),
            std::string::npos);
  EXPECT_NE(message.find("\nHint: derive patches are leaf-only."), std::string::npos);
  EXPECT_EQ(message.find("Summary"), std::string::npos);
}

TEST(PatchReport, UnknownPhaseHasNoAnnotation)
{
  PatchReportOptions options;
  options.component = "Card";
  options.summary.remaining_delete_path_keys = {R"(["gone"])"};

  EXPECT_EQ(
    format_patch_failure(R"(["gone"])", options),
    "Cannot fully apply patches for Card.\n"
    "First un-applied path: \"gone\" (non-literal AST shape or missing path)\n"
    "Summary: unapplied delete=1 (unknown=1); preview: \"gone\" (unknown)");
}

TEST(PatchReport, PreviewIsTruncated)
{
  PatchReportOptions options;
  options.component = "List";
  options.phase_of = lookup({{R"(["a"])", PatchPhase::Diff},
                             {R"(["b"])", PatchPhase::Derive},
                             {R"(["c"])", PatchPhase::Diff},
                             {R"(["d"])", PatchPhase::Prune}});
  options.summary.remaining_set_path_keys = {R"(["a"])", R"(["b"])", R"(["c"])"};
  options.summary.remaining_delete_path_keys = {R"(["d"])"};
  options.summary.max_preview_paths = 2;

  const std::string message = format_patch_failure(R"(["a"])", options);
  EXPECT_NE(
    message.find("Summary: unapplied set=3 (diff=2, derive=1), delete=1 (prune=1); "
                 "preview: \"a\" (diff), \"b\" (derive), … (2 more)"),
    std::string::npos);
}

TEST(PatchReport, PreviewCanBeDisabled)
{
  PatchReportOptions options;
  options.component = "Card";
  options.summary.remaining_set_path_keys = {R"(["a"])"};
  options.summary.max_preview_paths = 0;

  const std::string message = format_patch_failure(R"(["a"])", options);
  EXPECT_NE(message.find("Summary: unapplied set=1 (unknown=1)"), std::string::npos);
  EXPECT_EQ(message.find("preview"), std::string::npos);
}

TEST(PatchReport, ReportThrowsWithPhase)
{
  PatchReportOptions options;
  options.component = "Card";
  options.phase_of = lookup({{R"(["x"])", PatchPhase::Prune}});

  try {
    report_patch_failure(R"(["x"])", options);
  } catch (const PatchApplicationError & e) {
    EXPECT_EQ(e.kind(), ErrorKind::PatchApplication);
    EXPECT_EQ(e.first_unapplied_path_key(), R"(["x"])");
    EXPECT_EQ(e.phase(), PatchPhase::Prune);
    EXPECT_EQ(std::string(e.what()), format_patch_failure(R"(["x"])", options));
    return;
  }
  FAIL() << "expected PatchApplicationError";
}

}  // namespace refiner

// refiner/driver/refiner_driver.cpp - Refinement driver implementation
//
#include "refiner/driver/refiner_driver.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "refiner/ast/expr_printer.hpp"
#include "refiner/refine/error.hpp"
#include "refiner/refine/pipeline.hpp"

namespace refiner
{

namespace
{

std::string_view diagnostic_code(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::Configuration:
      return "R0101";
    case ErrorKind::Validation:
      return "R0201";
    case ErrorKind::PatchApplication:
      return "R0401";
    case ErrorKind::Encoding:
      return "R0402";
  }
  return "R0000";
}

/// Convert a call-site failure into a diagnostic on the call range.
void report_refine_error(
  DiagnosticBag & diags, const ComponentMatch & match, const RefineError & error)
{
  const SourceRange range = get_range(match.call);
  auto builder = diags.report_error(range, error.what(), "call site");
  builder.with_code(std::string(diagnostic_code(error.kind())));

  if (const auto * validation = dynamic_cast<const ValidationError *>(&error)) {
    if (validation->issue_path() && !match.component.empty()) {
      builder.with_note(
        "invalid value at " +
        format_path_label(match.component + ".props", *validation->issue_path()));
    }
    if (match.props) {
      builder.with_secondary_label(get_range(match.props), "props");
    }
    return;
  }

  if (const auto * patch = dynamic_cast<const PatchApplicationError *>(&error)) {
    if (patch->phase() == PatchPhase::Derive) {
      builder.with_help(
        "add a placeholder slot for the derived prop at this call site so a literal "
        "exists to replace");
    } else {
      builder.with_help(
        "the props literal at this call site is not static where the rule rewrites it; "
        "use literal values for these props");
    }
  }
}

}  // namespace

RefineResult Refiner::refine_file(
  const std::filesystem::path & file, const DriverOptions & options) const
{
  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    RefineResult result;
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    RefineResult result;
    result.diagnostics.report_error(SourceRange{}, "failed to open file: " + file.string());
    return result;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return refine_source(buffer.str(), file, options);
}

RefineResult Refiner::refine_source(
  std::string source_text, const std::filesystem::path & display_path,
  const DriverOptions & options) const
{
  RefineResult result;
  result.unit = parse_source(std::move(source_text), display_path);

  // Syntax errors stop the pipeline; the tree is not trusted for rewriting.
  result.diagnostics.merge(std::move(result.unit->diags));
  if (result.diagnostics.has_errors() || !result.unit->program) {
    return result;
  }

  RefineOptions refine_options = config_.options;
  if (options.mode == RefineMode::Check) {
    refine_options.apply_transforms = false;
  }

  const CallSiteErrorHandler on_error = [&result](
                                          const ComponentMatch & match, const RefineError & e) {
    report_refine_error(result.diagnostics, match, e);
    return false;
  };

  result.modified_call_sites = refine_program(
    result.unit->program, result.unit->ast, config_.rules, refine_options, on_error);

  if (options.verbose) {
    std::cerr << "Refined " << result.modified_call_sites << " call site(s) in "
              << display_path.string() << "\n";
  }

  if (result.diagnostics.has_errors()) {
    return result;
  }

  if (options.mode == RefineMode::Build) {
    result.output_text = print_program(result.unit->program);

    if (options.output_file && !options.dry_run) {
      std::ofstream out(*options.output_file, std::ios::binary);
      if (!out.is_open()) {
        result.diagnostics.report_error(
          SourceRange{}, "failed to open output file: " + options.output_file->string());
        return result;
      }
      out << result.output_text;
      result.written_file = *options.output_file;
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace refiner

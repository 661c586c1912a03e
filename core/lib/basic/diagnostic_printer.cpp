// refiner/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colours.
//
#include "refiner/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace refiner
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

std::string display_name(const SourceManager & source)
{
  if (!source.has_file_path()) {
    return "<input>";
  }
  std::error_code ec;
  const auto rel =
    std::filesystem::relative(source.get_file_path(), std::filesystem::current_path(), ec);
  return (ec || rel.empty()) ? source.get_file_path().string() : rel.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_severity_header(diag);

  const FullSourceRange primary = source.get_full_range(diag.primary_range());
  const std::string filename = display_name(source);
  if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary.start_line, primary.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }
  for (const auto & note : diag.notes) {
    print_trailer("note", note);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<Diagnostic> sorted(diags.begin(), diags.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().get_begin() < b.primary_range().get_begin();
  });
  for (const auto & d : sorted) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Note:
      os_ << rang::fg::cyan;
      break;
  }
  os_ << name << code << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  // Multi-line ranges are marked on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : static_cast<uint32_t>(source.get_line(fr.start_line - 1).size()) + 1;

  print_source_line(source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  std::string cleaned;
  cleaned.reserve(line.size());
  std::string marker_prefix;
  for (size_t i = 0; i < line.size(); ++i) {
    const bool before_marker = i + 1 < start_col;
    if (line[i] == '\t') {
      cleaned += "    ";
      if (before_marker) marker_prefix += "    ";
    } else {
      cleaned += line[i];
      if (before_marker) marker_prefix += ' ';
    }
  }

  const uint32_t line_num = line_index + 1;
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned);

  const size_t marker_len = end_col > start_col ? end_col - start_col : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "      | {}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? fmt::format("{}  -->{}", "\033[1;36m", "\033[0m") : "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? fmt::format("{}      |{}", "\033[1;36m", "\033[0m") : "      |";
}

}  // namespace refiner

// refiner/basic/diagnostic_printer.hpp
//
// Renders diagnostics with a source excerpt in Rust style:
//
//   error[R0401]: Cannot fully apply patches for Card.
//     --> content/page.js:12:21
//      |
//   12 |   return _jsx(Card, {title: t});
//      |                     ^^^^^^^^^^^ call site
//      |
//      = help: ...
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "refiner/basic/diagnostic.hpp"
#include "refiner/basic/source_manager.hpp"

namespace refiner
{

class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colours through rang
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceManager & source);
  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace refiner

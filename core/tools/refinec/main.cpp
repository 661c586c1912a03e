// refinec - static props refiner command line interface
//
// Usage:
//   refinec build <file.js> [-o out.js] [--config refiner.yaml] [--dry-run] [-v]
//   refinec check <file.js> [--config refiner.yaml]
//   refinec dump-ast <file.js>
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "refiner/ast/json_visitor.hpp"
#include "refiner/basic/diagnostic_printer.hpp"
#include "refiner/driver/refiner_driver.hpp"
#include "refiner/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "refiner v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <file.js> [options]\n\n"
            << "Commands:\n"
            << "  build <file.js>          Refine component props and print the module\n"
            << "  check <file.js>          Validate component props without rewriting\n"
            << "  dump-ast <file.js>       Print the parsed module as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Write the refined module to a file\n"
            << "  --config <path>          Use this refiner.yaml instead of searching\n"
            << "  --dry-run                Refine without writing any output\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const refiner::RefineResult & result)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  refiner::DiagnosticPrinter printer(std::cerr, use_color);

  if (result.unit) {
    printer.print_all(result.diagnostics, result.unit->source);
    return;
  }

  // No parsed module (missing file): print without source context
  for (const auto & diag : result.diagnostics) {
    std::cerr << "error: " << diag.message;
    if (!diag.code.empty()) {
      std::cerr << " [" << diag.code << "]";
    }
    std::cerr << "\n";
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  bool dry_run = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--dry-run") {
      args.dry_run = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

/// Load --config, or search upward from the input file. No file means no rules.
std::optional<refiner::ProjectConfig> load_config(const CommandArgs & args, const fs::path & input)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else {
    config_path = refiner::find_project_config(input.parent_path());
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << refiner::k_project_config_file_name
                << " found; no components are registered\n";
    }
    return refiner::ProjectConfig{};
  }

  auto config_result = refiner::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_path->string() << ": " << config_result.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << " ("
              << config_result.config.rules.size() << " component rule(s))\n";
  }
  return std::move(config_result.config);
}

/// Absolute input path, or nullopt after reporting why it is unusable.
std::optional<fs::path> resolve_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: refinec " << args.command << " <file.js>\n";
    return std::nullopt;
  }

  fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }
  return input_path;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_build(const CommandArgs & args)
{
  const auto input_path = resolve_input(args);
  if (!input_path) {
    return 1;
  }

  auto config = load_config(args, *input_path);
  if (!config) {
    return 1;
  }

  refiner::DriverOptions options;
  options.mode = refiner::RefineMode::Build;
  options.dry_run = args.dry_run;
  options.verbose = args.verbose;
  if (!args.output_path.empty()) {
    options.output_file = fs::absolute(args.output_path);
  }

  if (args.verbose) {
    std::cerr << "Building: " << input_path->string() << "\n";
  }

  const refiner::Refiner driver(std::move(*config));
  const auto result = driver.refine_file(*input_path, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result);
  }

  if (!result.success) {
    return 1;
  }

  if (result.written_file) {
    std::cerr << "Generated: " << result.written_file->string() << "\n";
  } else if (!args.dry_run) {
    std::cout << result.output_text;
  }

  return 0;
}

int cmd_check(const CommandArgs & args)
{
  const auto input_path = resolve_input(args);
  if (!input_path) {
    return 1;
  }

  auto config = load_config(args, *input_path);
  if (!config) {
    return 1;
  }

  refiner::DriverOptions options;
  options.mode = refiner::RefineMode::Check;
  options.verbose = args.verbose;

  if (args.verbose) {
    std::cerr << "Checking: " << input_path->string() << "\n";
  }

  const refiner::Refiner driver(std::move(*config));
  const auto result = driver.refine_file(*input_path, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result);
  }

  if (result.success) {
    std::cout << args.input_file << ": OK\n";
    return 0;
  }

  return 1;
}

int cmd_dump_ast(const CommandArgs & args)
{
  const auto input_path = resolve_input(args);
  if (!input_path) {
    return 1;
  }

  // Parse only: an empty registry matches no call sites.
  refiner::DriverOptions options;
  options.mode = refiner::RefineMode::Check;

  const refiner::Refiner driver(refiner::ProjectConfig{});
  const auto result = driver.refine_file(*input_path, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result);
  }

  if (!result.unit || !result.unit->program) {
    return 1;
  }

  std::cout << refiner::to_json(result.unit->program).dump(2) << "\n";
  return result.diagnostics.has_errors() ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "build") {
    return cmd_build(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

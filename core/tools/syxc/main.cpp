// syxc - Syntax Script Compiler Command Line Interface
//
// Usage:
//   syxc compile [--project <dir>] [-o output] [-f format] [-v]
//   syxc check <file>
//   syxc diagnostics <file>
//
#include <fmt/core.h>

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "syx/basic/diagnostic_printer.hpp"
#include "syx/basic/source_manager.hpp"
#include "syx/driver/compiler.hpp"
#include "syx/lsp/report.hpp"
#include "syx/project/project_config.hpp"
#include "syx/sema/diagnostic_engine.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Syntax Script Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  compile                  Compile the project found from the current directory\n"
            << "  check <file>             Print the diagnostics of one file\n"
            << "  diagnostics <file>       Print the diagnostic report of one file as JSON\n\n"
            << "Options:\n"
            << "  --project <dir>          Start the syxconfig search from <dir>\n"
            << "  -o, --output <path>      Output directory (overrides compile.out)\n"
            << "  -f, --format <ext>       Target format (overrides compile.format)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const syx::DiagnosticBag & diagnostics, const syx::SourceRegistry & sources)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  syx::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string project_dir;
  std::string output_path;
  std::string format;
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
    } else if (arg == "-f" || arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "--project") {
      if (i + 1 < argc) {
        args.project_dir = argv[++i];
      }
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

// ============================================================================
// Commands
// ============================================================================

int cmd_compile(const CommandArgs & args)
{
  syx::CompileOptions options;
  options.mode = syx::CompileMode::Build;
  if (!args.output_path.empty()) {
    options.output_dir = fs::absolute(args.output_path);
  }
  if (!args.format.empty()) {
    options.format = args.format;
  }

  const fs::path start_dir =
    args.project_dir.empty() ? fs::current_path() : fs::absolute(args.project_dir);

  auto config_path = syx::find_project_config(start_dir);
  if (!config_path) {
    std::cerr << "error: no " << syx::k_project_config_file_name << " or "
              << syx::k_project_config_json_file_name
              << " found in " << start_dir.string() << " or its parents\n";
    return 1;
  }

  const auto config_result = syx::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }

  if (args.verbose) {
    fmt::print(stderr, "Compiling project: {}\n", config_result.config.name);
  }

  const syx::CompileResult result = syx::Compiler::compile_project(config_result.config, options);

  if (args.verbose) {
    for (const auto & file : result.compiled_files) {
      fmt::print(stderr, "compiling {}\n", file.string());
    }
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.sources);
  }

  for (const auto & file : result.generated_files) {
    fmt::print(stderr, "Generated: {}\n", file.string());
  }

  return result.success ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: syxc check <file>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  const auto text = syx::read_file_to_string(input_path);
  if (!text) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  const syx::DiagnosticBag diagnostics =
    syx::collect_diagnostics(input_path.string(), std::string_view(*text));

  syx::SourceRegistry sources;
  sources.add(input_path, *text);

  if (!diagnostics.empty()) {
    print_diagnostics(diagnostics, sources);
  }

  if (diagnostics.has_errors()) {
    return 1;
  }

  fmt::print("{}: OK\n", args.input_file);
  return 0;
}

int cmd_diagnostics(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: syxc diagnostics <file>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  const auto report = syx::create_diagnostic_report(input_path.string());

  std::cout << syx::lsp::report_to_json(report).dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "compile") {
    return cmd_compile(args);
  }
  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "diagnostics") {
    return cmd_diagnostics(args);
  }

  std::cerr << "error: unknown command: " << args.command << "\n\n";
  print_usage(argv[0]);
  return 1;
}

// docschema - Schema inference and query validation command line interface
//
// Usage:
//   docschema infer <file|dir> [--collection NAME] [--sample-size N] [-o output.json]
//   docschema check-syntax <query.json>
//   docschema check <query.json> --schema <schema.json> [--collection NAME]
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "docschema/basic/diagnostic_printer.hpp"
#include "docschema/driver/sample_loader.hpp"
#include "docschema/driver/toolkit.hpp"
#include "docschema/project/toolkit_config.hpp"
#include "docschema/query/report.hpp"
#include "docschema/schema/schema_json.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "docschema v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  infer <file|dir>         Infer a collection (file) or database (dir) schema\n"
            << "  check-syntax <query>     Check query filter syntax (no schema)\n"
            << "  check <query>            Check a query filter against a schema\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Write the inferred schema to a file\n"
            << "  --collection <name>      Restrict to one collection\n"
            << "  --sample-size <n>        Documents sampled per collection (0 = all)\n"
            << "  --schema <path>          Schema snapshot used by 'check'\n"
            << "  --config <path>          Configuration file (default: docschema.yaml search)\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string schema_path;
  std::string config_path;
  std::optional<std::string> collection;
  std::optional<std::string> sample_size;
  bool no_color = false;
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
    } else if (arg == "--collection") {
      if (i + 1 < argc) {
        args.collection = argv[++i];
      }
    } else if (arg == "--sample-size") {
      if (i + 1 < argc) {
        args.sample_size = argv[++i];
      }
    } else if (arg == "--schema") {
      if (i + 1 < argc) {
        args.schema_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
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
// Shared Helpers
// ============================================================================

bool use_color(const CommandArgs & args)
{
  // Detect if terminal supports colors (simple check for TTY)
  return !args.no_color && isatty(fileno(stderr)) != 0;
}

void print_diagnostics(
  const docschema::DiagnosticBag & diagnostics, const CommandArgs & args,
  const std::string & origin)
{
  docschema::DiagnosticPrinter printer(std::cerr, use_color(args));
  printer.print_all(diagnostics, origin);
  printer.print_summary(diagnostics);
}

/// Explicit --config, else docschema.yaml found upward from the working directory
std::optional<docschema::ToolkitConfig> resolve_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    config_path = docschema::find_toolkit_config(fs::current_path());
  }

  if (!config_path) {
    return docschema::ToolkitConfig{};
  }

  const auto config_result = docschema::load_toolkit_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  return config_result.config;
}

std::optional<docschema::Json> load_json_input(const std::string & path, const char * what)
{
  if (path.empty()) {
    std::cerr << "error: " << what << " file required\n";
    return std::nullopt;
  }
  auto loaded = docschema::load_json_file(path);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return std::nullopt;
  }
  return std::move(loaded.documents.front());
}

bool write_output(const docschema::Json & value, const CommandArgs & args, int indent)
{
  const std::string text =
    value.dump(indent, ' ', false, docschema::Json::error_handler_t::replace);
  if (args.output_path.empty()) {
    std::cout << text << "\n";
    return true;
  }

  std::ofstream out(args.output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return false;
  }
  out << text << "\n";
  if (args.verbose) {
    std::cerr << "Wrote schema: " << args.output_path << "\n";
  }
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_infer(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file or directory required\n";
    std::cerr << "usage: docschema infer <file|dir> [--collection NAME] [-o output.json]\n";
    return 1;
  }

  auto config = resolve_config(args);
  if (!config) {
    return 1;
  }
  if (args.sample_size) {
    try {
      const long long value = std::stoll(*args.sample_size);
      if (value < 0) {
        throw std::out_of_range("negative");
      }
      config->inference.sample_size = static_cast<size_t>(value);
    } catch (const std::exception &) {
      std::cerr << "error: invalid --sample-size: " << *args.sample_size << "\n";
      return 1;
    }
  }

  const docschema::Toolkit toolkit(*config);
  const fs::path input_path = fs::absolute(args.input_file);

  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  if (fs::is_directory(input_path)) {
    if (args.verbose) {
      std::cerr << "Inferring database schema: " << input_path.string() << "\n";
    }
    const auto result = toolkit.infer_database(input_path, args.collection);
    if (!result.diagnostics.empty()) {
      print_diagnostics(result.diagnostics, args, args.input_file);
    }
    if (!result.success) {
      return 1;
    }
    if (args.verbose) {
      std::cerr << "Collections inferred: " << result.schema.size() << "\n";
    }
    return write_output(docschema::to_json(result.schema), args, config->output.indent) ? 0 : 1;
  }

  if (args.verbose) {
    std::cerr << "Inferring collection schema: " << input_path.string() << "\n";
  }
  const auto result = toolkit.infer_collection(input_path);
  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args, args.input_file);
  }
  if (!result.success) {
    return 1;
  }
  if (args.verbose) {
    std::cerr << "Documents analyzed: " << result.documents_analyzed
              << ", skipped: " << result.documents_skipped << "\n";
  }
  return write_output(docschema::to_json(result.schema), args, config->output.indent) ? 0 : 1;
}

int cmd_check_syntax(const CommandArgs & args)
{
  const auto config = resolve_config(args);
  if (!config) {
    return 1;
  }
  const auto query = load_json_input(args.input_file, "query");
  if (!query) {
    return 1;
  }

  const docschema::Toolkit toolkit(*config);
  const auto result = toolkit.validate_syntax(*query);

  if (args.verbose && !result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args, args.input_file);
  }
  std::cout << docschema::query::format_syntax_report(result.messages()) << "\n";
  return result.valid ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  const auto config = resolve_config(args);
  if (!config) {
    return 1;
  }
  const auto query = load_json_input(args.input_file, "query");
  if (!query) {
    return 1;
  }
  const auto schema = load_json_input(args.schema_path, "schema (--schema)");
  if (!schema) {
    return 1;
  }

  const docschema::Toolkit toolkit(*config);
  const auto result = toolkit.validate_against_schema(*query, *schema, args.collection);

  if (args.verbose && !result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args, args.input_file);
  }
  std::cout << docschema::query::format_schema_report(result.messages()) << "\n";
  return result.valid ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "infer") {
      return cmd_infer(args);
    }

    if (args.command == "check-syntax") {
      return cmd_check_syntax(args);
    }

    if (args.command == "check") {
      return cmd_check(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

// oasgen - Reference resolver command line interface
//
// Usage:
//   oasgen check [schema | --project] [-b base-dir] [-c component]...
//   oasgen dump  [schema | --project] [-b base-dir] [-p pointer] [-o output]
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "oasgen/basic/diagnostic_printer.hpp"
#include "oasgen/driver/resolver_driver.hpp"
#include "oasgen/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "oasgen reference resolver v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [schema]           Resolve every \"$ref\" and report failures\n"
            << "  dump [schema]            Print a fragment as JSON with references inlined\n\n"
            << "Options:\n"
            << "  -b, --base-dir <dir>     Base of document paths (default: schema dir)\n"
            << "  -c, --component <file>   Additional document to load (repeatable)\n"
            << "  -p, --pointer <pointer>  Fragment to dump (default: /)\n"
            << "  -o, --output <path>      Write dump output to a file\n"
            << "  --max-depth <n>          Maximum indirections per reference (default: 64)\n"
            << "  --project                Use oasgen.yaml from the current directory or parents\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const oasgen::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  oasgen::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
  printer.print_summary(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string schema_file;
  std::string base_dir;
  std::vector<std::string> components;
  std::string pointer = "/";
  std::string output_path;
  std::string max_depth;
  bool use_project = false;
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

    if (arg == "-b" || arg == "--base-dir") {
      if (i + 1 < argc) {
        args.base_dir = argv[++i];
      }
    } else if (arg == "-c" || arg == "--component") {
      if (i + 1 < argc) {
        args.components.emplace_back(argv[++i]);
      }
    } else if (arg == "-p" || arg == "--pointer") {
      if (i + 1 < argc) {
        args.pointer = argv[++i];
      }
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--max-depth") {
      if (i + 1 < argc) {
        args.max_depth = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.schema_file.empty()) {
      args.schema_file = arg;
    }
  }

  return args;
}

/// Build resolver options from a project file or the command line; false on error
bool make_options(const CommandArgs & args, oasgen::ResolveOptions & options)
{
  if (args.use_project || args.schema_file.empty()) {
    // Project mode: find oasgen.yaml
    auto config_path = oasgen::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << oasgen::k_project_config_file_name
                << " found in current directory or parents\n";
      return false;
    }

    const auto config_result = oasgen::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return false;
    }

    if (args.verbose) {
      std::cerr << "Using project: " << config_path->string() << "\n";
    }

    options = oasgen::ResolveOptions::from_config(config_result.config);
  } else {
    options.schema = fs::absolute(args.schema_file);
    // Without -b, document paths are relative to the schema's directory
    options.base_dir =
      args.base_dir.empty() ? options.schema.parent_path() : fs::absolute(args.base_dir);

    if (!fs::exists(options.schema)) {
      std::cerr << "error: file not found: " << options.schema.string() << "\n";
      return false;
    }
  }

  // Command line components add to the configured ones
  for (const auto & component : args.components) {
    options.components.push_back(fs::absolute(component));
  }

  if (!args.max_depth.empty()) {
    char * end = nullptr;
    const long long depth = std::strtoll(args.max_depth.c_str(), &end, 10);
    if (end == args.max_depth.c_str() || *end != '\0' || depth <= 0) {
      std::cerr << "error: --max-depth expects a positive integer, got '" << args.max_depth
                << "'\n";
      return false;
    }
    options.max_reference_depth = static_cast<std::size_t>(depth);
  }

  options.pointer = args.pointer;
  options.verbose = args.verbose;
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  oasgen::ResolveOptions options;
  if (!make_options(args, options)) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Checking: " << options.schema.string() << "\n";
  }

  const oasgen::ResolveResult result = oasgen::ResolverDriver::check(options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  std::cout << options.schema.filename().string() << ": OK (" << result.documents_loaded
            << " documents, " << result.references_checked << " references)\n";
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  oasgen::ResolveOptions options;
  if (!make_options(args, options)) {
    return 1;
  }

  const oasgen::ResolveResult result = oasgen::ResolverDriver::dump(options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success || !result.output) {
    return 1;
  }

  if (args.output_path.empty()) {
    std::cout << *result.output << "\n";
    return 0;
  }

  std::ofstream out(args.output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return 1;
  }
  out << *result.output << "\n";

  if (args.verbose) {
    std::cerr << "Wrote " << args.output_path << "\n";
  }
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

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "dump") {
      return cmd_dump(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

// codesynth - Code synthesis command line interface
//
// Usage:
//   codesynth generate [input.json | --project] [--cap <name>]... [--json] [-o output]
//   codesynth check [input.json | --project] [--cap <name>]...
//   codesynth list-generators [--cap <name>]...
//
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

#include "codesynth/basic/diagnostic_printer.hpp"
#include "codesynth/builtins/builtin_generators.hpp"
#include "codesynth/driver/session.hpp"
#include "codesynth/project/project_config.hpp"
#include "codesynth/registry/generator_registry.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "codesynth v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  generate [input.json]    Synthesize the requested declarations\n"
            << "  check [input.json]       Synthesize and report diagnostics only\n"
            << "  list-generators          List generators active for the capabilities\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (default: stdout)\n"
            << "  --project                Use inputs from codesynth.yaml\n"
            << "  --cap <name>             Enable a capability (package name, repeatable)\n"
            << "  --json                   Emit expression trees as JSON\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const codesynth::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  codesynth::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::vector<std::string> capabilities;
  bool use_project = false;
  bool json = false;
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
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--cap") {
      if (i + 1 < argc) {
        args.capabilities.emplace_back(argv[++i]);
      }
    } else if (arg == "--json") {
      args.json = true;
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

/// Output settings after merging the project file and the command line
struct OutputSettings
{
  codesynth::OutputFormat format = codesynth::OutputFormat::Elm;
  fs::path path;
};

bool run_session(
  const CommandArgs & args, codesynth::SessionResult & result, OutputSettings & output)
{
  codesynth::SessionOptions options;
  options.capabilities = args.capabilities;
  options.verbose = args.verbose;
  options.log = &std::cerr;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find codesynth.yaml
    auto config_path = codesynth::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << codesynth::k_project_config_file_name
                << " found in current directory or parents\n";
      return false;
    }

    const auto config_result = codesynth::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return false;
    }

    if (args.verbose) {
      std::cerr << "Synthesizing project: " << config_result.config.package.name << "\n";
    }

    output.format = config_result.config.output.format;
    output.path = config_result.config.output.path;
    result = codesynth::Session::run_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return false;
    }

    if (args.verbose) {
      std::cerr << "Synthesizing: " << input_path.string() << "\n";
    }

    result = codesynth::Session::run_files({input_path}, options);
  }

  if (args.json) {
    output.format = codesynth::OutputFormat::Json;
  }
  if (!args.output_path.empty()) {
    output.path = args.output_path;
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }
  return true;
}

int cmd_generate(const CommandArgs & args)
{
  codesynth::SessionResult result;
  OutputSettings output;
  if (!run_session(args, result, output)) {
    return 1;
  }

  if (!result.success) {
    return 1;
  }

  const std::string text = codesynth::render_output(result.declarations, output.format);
  if (output.path.empty()) {
    std::cout << text;
    return 0;
  }

  if (output.path.has_parent_path()) {
    fs::create_directories(output.path.parent_path());
  }
  std::ofstream out(output.path);
  if (!out) {
    std::cerr << "error: cannot write " << output.path.string() << "\n";
    return 1;
  }
  out << text;
  std::cerr << "Generated: " << output.path.string() << "\n";
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  codesynth::SessionResult result;
  OutputSettings output;
  if (!run_session(args, result, output)) {
    return 1;
  }

  if (!result.success) {
    return 1;
  }

  std::cerr << "Check passed: " << result.declarations.size() << " declaration(s)\n";
  return 0;
}

int cmd_list_generators(const CommandArgs & args)
{
  codesynth::ActivationContext ctx;
  const auto capabilities =
    args.capabilities.empty() ? codesynth::base_capabilities() : args.capabilities;
  for (const auto & cap : capabilities) {
    ctx.enable(cap);
  }

  const auto generators =
    codesynth::resolve_generators(ctx, codesynth::builtin_generators());
  for (const auto & gen : generators) {
    std::cout << gen.id << "  " << gen.pattern.render() << "  (" << gen.resolvers.size()
              << " resolver(s)" << (gen.lambda_breaker ? ", lambda-breaker" : "") << ")\n";
    for (const auto & ref : gen.blessed) {
      std::cout << "    blessed: " << ref.render() << "\n";
    }
  }
  return 0;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "generate") {
    return cmd_generate(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "list-generators") {
    return cmd_list_generators(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

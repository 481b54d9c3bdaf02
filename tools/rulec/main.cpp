// rulec - Rule DSL Compiler Command Line Interface
//
// Usage:
//   rulec check <rules.json>
//   rulec run [rules.json] [--project <rulec.yaml>] [--seed N] [--turns N]
//   rulec tokens
//
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "rule_dsl/ast/token_context.hpp"
#include "rule_dsl/ast/token_json.hpp"
#include "rule_dsl/basic/diagnostic_printer.hpp"
#include "rule_dsl/driver/compiler.hpp"
#include "rule_dsl/driver/error_reporter.hpp"
#include "rule_dsl/driver/rule_resolver.hpp"
#include "rule_dsl/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Rule DSL Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check <rules.json>       Type check and compile every rule\n"
            << "  run [rules.json]         Resolve the acting character's action\n"
            << "  tokens                   List the registered token signatures\n\n"
            << "Options:\n"
            << "  --project <path>         Use the given rulec.yaml\n"
            << "  --seed <n>               Override battle.seed\n"
            << "  --turns <n>              Override battle.turns\n"
            << "  --debug                  Dump typed ASTs to stderr\n"
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
  std::string project_path;
  std::optional<uint32_t> seed;
  std::optional<uint32_t> turns;
  bool debug = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<uint32_t> parse_u32(const std::string & s)
{
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    const unsigned long v = std::stoul(s);
    if (v > UINT32_MAX) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(v);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

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

    if (arg == "--project") {
      if (i + 1 < argc) {
        args.project_path = argv[++i];
      } else {
        args.error = "--project requires a path";
      }
    } else if (arg == "--seed" || arg == "--turns") {
      std::optional<uint32_t> value;
      if (i + 1 < argc) {
        value = parse_u32(argv[++i]);
      }
      if (!value) {
        args.error = arg + " requires a non-negative integer";
      } else if (arg == "--seed") {
        args.seed = value;
      } else {
        args.turns = value;
      }
    } else if (arg == "--debug") {
      args.debug = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

bool use_color(const CommandArgs & args, rule_dsl::ColorMode mode)
{
  if (args.no_color || mode == rule_dsl::ColorMode::Never) {
    return false;
  }
  if (mode == rule_dsl::ColorMode::Always) {
    return true;
  }
  return isatty(fileno(stderr)) != 0;
}

/// Load the project config named by --project, or search upward from cwd.
std::optional<rule_dsl::ProjectConfig> load_config(const CommandArgs & args, bool required)
{
  std::optional<fs::path> config_path;
  if (!args.project_path.empty()) {
    config_path = fs::path(args.project_path);
  } else {
    config_path = rule_dsl::find_project_config(fs::current_path());
  }

  if (!config_path) {
    if (required) {
      std::cerr << "error: no " << rule_dsl::k_project_config_file_name
                << " found in current directory or parents\n";
    }
    return std::nullopt;
  }

  auto result = rule_dsl::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Using project: " << config_path->string() << "\n";
  }
  return std::move(result.config);
}

/// Origin label for the i-th rule of a file, e.g. `rules.json#2`
std::string rule_origin(const fs::path & file, size_t index)
{
  return file.filename().string() + "#" + std::to_string(index + 1);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: rule file required\n";
    std::cerr << "usage: rulec check <rules.json>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (args.verbose) {
    std::cerr << "Checking: " << input_path.string() << "\n";
  }

  rule_dsl::TokenContext tokens;
  const auto loaded = rule_dsl::load_rule_set(input_path, tokens);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return 1;
  }

  const auto config = load_config(args, false);
  const auto color_mode = config ? config->compiler.color : rule_dsl::ColorMode::Auto;

  rule_dsl::CompileOptions options;
  options.debug = args.debug || (config && config->compiler.debug);
  rule_dsl::RuleCompiler compiler(options);

  rule_dsl::DiagnosticPrinter printer(std::cerr, use_color(args, color_mode));
  std::vector<rule_dsl::CompileError> errors;

  for (size_t i = 0; i < loaded.rules.size(); ++i) {
    const auto result = compiler.compile(loaded.rules[i]);
    if (!result.diagnostics.empty()) {
      printer.print_all(result.diagnostics, rule_origin(input_path, i));
    }
    if (!result.success) {
      errors.push_back(*result.error);
    }
  }

  if (!errors.empty()) {
    const rule_dsl::ErrorReporter reporter(compiler.tokens());
    std::cerr << "\n" << reporter.format_errors(errors);
    return 1;
  }

  std::cout << args.input_file << ": OK (" << loaded.rules.size() << " rule(s))\n";
  return 0;
}

int cmd_run(const CommandArgs & args)
{
  const auto config = load_config(args, true);
  if (!config) {
    return 1;
  }

  const auto & battle = config->battle;
  const auto & acting_team =
    battle.acting_side == rule_dsl::TeamSide::Player ? battle.player_team : battle.enemy_team;
  if (battle.acting_index >= acting_team.members.size()) {
    std::cerr << "error: battle has no acting character (check battle.acting)\n";
    return 1;
  }

  std::vector<fs::path> rule_files;
  if (!args.input_file.empty()) {
    rule_files.push_back(fs::absolute(args.input_file));
  } else {
    for (const auto & f : config->compiler.rule_files) {
      rule_files.push_back(f.is_absolute() ? f : config->project_root / f);
    }
  }
  if (rule_files.empty()) {
    std::cerr << "error: no rule files given and compiler.rule_files is empty\n";
    return 1;
  }

  rule_dsl::CompileOptions options;
  options.debug = args.debug || config->compiler.debug;
  rule_dsl::RuleCompiler compiler(options);
  rule_dsl::DiagnosticPrinter printer(std::cerr, use_color(args, config->compiler.color));

  rule_dsl::TokenContext tokens;
  std::vector<rule_dsl::NodePtr<rule_dsl::ActionPtr>> rules;
  bool failed = false;

  for (const auto & file : rule_files) {
    const auto loaded = rule_dsl::load_rule_set(file, tokens);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return 1;
    }
    for (size_t i = 0; i < loaded.rules.size(); ++i) {
      auto result = compiler.compile(loaded.rules[i]);
      if (!result.success) {
        printer.print_all(result.diagnostics, rule_origin(file, i));
        failed = true;
        continue;
      }
      rules.push_back(std::move(result.node));
    }
  }

  if (failed) {
    std::cerr << "error: some rules failed to compile\n";
    return 1;
  }

  const auto ctx = battle.to_battle_context();
  const rule_dsl::CharacterRules character_rules(ctx.acting.id, std::move(rules));

  std::mt19937 rng(args.seed.value_or(battle.seed));
  const uint32_t turns = args.turns.value_or(battle.turns);

  if (args.verbose) {
    std::cerr << "Resolving " << character_rules.size() << " rule(s) for " << ctx.acting.name
              << " (ID:" << ctx.acting.id << ")\n";
  }

  for (uint32_t turn = 1; turn <= turns; ++turn) {
    const auto resolved = character_rules.resolve(ctx, rng);
    std::cout << "turn " << turn << ": ";
    if (!resolved.success()) {
      std::cout << "error: " << resolved.error->describe() << "\n";
      return 1;
    }
    if (resolved.has_action()) {
      std::cout << resolved.action->describe() << "\n";
    } else {
      std::cout << "no action\n";
    }
  }

  return 0;
}

int cmd_tokens(const CommandArgs & /*args*/)
{
  const rule_dsl::RuleCompiler compiler;
  for (const auto & name : compiler.tokens().token_names()) {
    const auto * sig = compiler.tokens().lookup(name);
    std::cout << rule_dsl::to_string(*sig);
    if (!sig->description.empty()) {
      std::cout << "\n    " << sig->description;
    }
    std::cout << "\n";
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

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "run") {
      return cmd_run(args);
    }

    if (args.command == "tokens") {
      return cmd_tokens(args);
    }
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

// rule_dsl/project/project_config.hpp - Project configuration (rulec.yaml)
//
// Parses and validates rulec.yaml: the rule files to compile, compiler
// switches, and the battle snapshot that `rulec run` resolves rules against.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rule_dsl/runtime/battle.hpp"

namespace rule_dsl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * When diagnostics are colored.
 */
enum class ColorMode : uint8_t {
  Auto,    ///< Only when stderr is a terminal
  Always,
  Never,
};

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Rule files to compile (relative to rulec.yaml)
  std::vector<std::filesystem::path> rule_files;

  /// Dump typed ASTs before code generation
  bool debug = false;

  ColorMode color = ColorMode::Auto;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Battle snapshot section.
 */
struct BattleConfig
{
  /// Seed of the shared random source
  uint32_t seed = 0;

  /// Number of turns `rulec run` resolves
  uint32_t turns = 1;

  /// Side and member index of the acting character
  TeamSide acting_side = TeamSide::Player;
  size_t acting_index = 0;

  Team player_team;
  Team enemy_team;

  /**
   * Build the evaluation view for the configured acting character.
   *
   * The index is validated at load time.
   */
  [[nodiscard]] BattleContext to_battle_context() const;
};

/**
 * Complete project configuration (rulec.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;
  BattleConfig battle;

  /// Directory containing rulec.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a rulec.yaml file.
 *
 * @param config_path Path to rulec.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a project configuration from YAML text.
 *
 * @param text YAML document
 * @param project_root Directory relative rule files are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to rulec.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

[[nodiscard]] std::optional<ColorMode> parse_color_mode(const std::string & s) noexcept;

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "rulec.yaml";

}  // namespace rule_dsl

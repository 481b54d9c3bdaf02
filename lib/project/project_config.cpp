// rule_dsl/project/project_config.cpp - Project configuration implementation
//
#include "rule_dsl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace rule_dsl
{

namespace
{

/// Parse one team member entry
std::optional<Character> parse_member(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "team member must be a map";
    return std::nullopt;
  }
  if (!node["id"] || !node["name"]) {
    error = "team member must have 'id' and 'name'";
    return std::nullopt;
  }

  Character c;
  c.id = node["id"].as<int32_t>();
  c.name = node["name"].as<std::string>();
  c.max_hp = node["max_hp"] ? node["max_hp"].as<int32_t>() : 100;
  c.hp = node["hp"] ? node["hp"].as<int32_t>() : c.max_hp;
  c.max_mp = node["max_mp"] ? node["max_mp"].as<int32_t>() : 0;
  c.mp = node["mp"] ? node["mp"].as<int32_t>() : c.max_mp;
  c.attack = node["attack"] ? node["attack"].as<int32_t>() : 0;

  if (c.hp < 0 || c.hp > c.max_hp) {
    error = "hp of '" + c.name + "' must be within 0..max_hp";
    return std::nullopt;
  }
  if (c.mp < 0 || c.mp > c.max_mp) {
    error = "mp of '" + c.name + "' must be within 0..max_mp";
    return std::nullopt;
  }
  return c;
}

/// Parse a team section
std::optional<Team> parse_team(
  const YAML::Node & node, const std::string & default_name, std::string & error)
{
  Team team;
  team.name = default_name;
  if (!node) {
    return team;
  }
  if (!node.IsMap()) {
    error = "must be a map";
    return std::nullopt;
  }

  if (node["name"]) {
    team.name = node["name"].as<std::string>();
  }
  if (node["members"]) {
    if (!node["members"].IsSequence()) {
      error = "members must be a list";
      return std::nullopt;
    }
    for (const auto & m : node["members"]) {
      auto member = parse_member(m, error);
      if (!member) {
        return std::nullopt;
      }
      team.members.push_back(std::move(*member));
    }
  }
  return team;
}

std::optional<TeamSide> parse_side(const std::string & s)
{
  if (s == "player") return TeamSide::Player;
  if (s == "enemy") return TeamSide::Enemy;
  return std::nullopt;
}

ConfigLoadResult build_config(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];

    if (comp["rule_files"]) {
      if (!comp["rule_files"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.rule_files must be a list");
      }
      for (const auto & f : comp["rule_files"]) {
        config.compiler.rule_files.emplace_back(f.as<std::string>());
      }
    }

    if (comp["debug"]) {
      config.compiler.debug = comp["debug"].as<bool>();
    }

    if (comp["color"]) {
      const auto color = comp["color"].as<std::string>();
      const auto mode = parse_color_mode(color);
      if (!mode) {
        return ConfigLoadResult::fail(
          "invalid compiler.color: '" + color + "' (must be 'auto', 'always' or 'never')");
      }
      config.compiler.color = *mode;
    }
  }

  // Parse 'battle' section
  if (root["battle"]) {
    const auto & battle = root["battle"];

    if (battle["seed"]) {
      config.battle.seed = battle["seed"].as<uint32_t>();
    }
    if (battle["turns"]) {
      config.battle.turns = battle["turns"].as<uint32_t>();
    }

    std::string team_error;
    auto player = parse_team(battle["player_team"], "Player", team_error);
    if (!player) {
      return ConfigLoadResult::fail("invalid battle.player_team: " + team_error);
    }
    auto enemy = parse_team(battle["enemy_team"], "Enemy", team_error);
    if (!enemy) {
      return ConfigLoadResult::fail("invalid battle.enemy_team: " + team_error);
    }
    config.battle.player_team = std::move(*player);
    config.battle.enemy_team = std::move(*enemy);

    if (battle["acting"]) {
      const auto & acting = battle["acting"];
      if (acting["side"]) {
        const auto side_name = acting["side"].as<std::string>();
        const auto side = parse_side(side_name);
        if (!side) {
          return ConfigLoadResult::fail(
            "invalid battle.acting.side: '" + side_name + "' (must be 'player' or 'enemy')");
        }
        config.battle.acting_side = *side;
      }
      if (acting["index"]) {
        config.battle.acting_index = acting["index"].as<size_t>();
      }
    }

    const auto & members = config.battle.acting_side == TeamSide::Player
                             ? config.battle.player_team.members
                             : config.battle.enemy_team.members;
    if (config.battle.acting_index >= members.size()) {
      return ConfigLoadResult::fail(
        "battle.acting.index " + std::to_string(config.battle.acting_index) +
        " is out of range for the " + std::string(to_string(config.battle.acting_side)) +
        " team (" + std::to_string(members.size()) + " member(s))");
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

BattleContext BattleConfig::to_battle_context() const
{
  BattleContext ctx;
  ctx.acting_side = acting_side;
  ctx.player_team = player_team;
  ctx.enemy_team = enemy_team;
  ctx.acting = ctx.team_members(acting_side).at(acting_index);
  return ctx;
}

std::optional<ColorMode> parse_color_mode(const std::string & s) noexcept
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root)
{
  try {
    const YAML::Node root = YAML::Load(text);
    return build_config(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return build_config(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace rule_dsl

// rule_dsl/runtime/battle.hpp - Read-only battle view
//
// Characters, teams and the per-turn battle context that evaluation
// nodes inspect. Stat bookkeeping (damage, MP spending) is done by the
// battle driver outside the rule runtime.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rule_dsl
{

// ============================================================================
// Character
// ============================================================================

struct Character
{
  int32_t id = 0;
  std::string name;
  int32_t hp = 0;
  int32_t max_hp = 0;
  int32_t mp = 0;
  int32_t max_mp = 0;
  int32_t attack = 0;

  [[nodiscard]] bool is_alive() const noexcept { return hp > 0; }
};

/// Characters compare by identity
inline bool operator==(const Character & a, const Character & b) noexcept { return a.id == b.id; }
inline bool operator!=(const Character & a, const Character & b) noexcept { return !(a == b); }

// ============================================================================
// Team
// ============================================================================

enum class TeamSide : uint8_t {
  Player,
  Enemy,
};

[[nodiscard]] std::string_view to_string(TeamSide side) noexcept;

struct Team
{
  std::string name;
  std::vector<Character> members;
};

// ============================================================================
// CharacterHP
// ============================================================================

/**
 * A character's HP as a numeric value that remembers its owner.
 *
 * Compared and ordered by `hp_value`.
 */
struct CharacterHP
{
  Character character;
  int32_t hp_value = 0;

  static CharacterHP of(const Character & c) { return CharacterHP{c, c.hp}; }

  [[nodiscard]] int32_t to_i32() const noexcept { return hp_value; }
};

inline bool operator==(const CharacterHP & a, const CharacterHP & b) noexcept
{
  return a.hp_value == b.hp_value;
}

/// Numeric projection used by comparison nodes
[[nodiscard]] inline int32_t to_i32(int32_t v) noexcept { return v; }
[[nodiscard]] inline int32_t to_i32(const CharacterHP & v) noexcept { return v.to_i32(); }

// ============================================================================
// BattleContext
// ============================================================================

/**
 * Snapshot of the battle from the acting character's point of view.
 */
struct BattleContext
{
  Character acting;
  TeamSide acting_side = TeamSide::Player;
  Team player_team;
  Team enemy_team;

  /// Player members followed by enemy members
  [[nodiscard]] std::vector<Character> all_characters() const;

  [[nodiscard]] const std::vector<Character> & team_members(TeamSide side) const noexcept
  {
    return side == TeamSide::Player ? player_team.members : enemy_team.members;
  }

  /**
   * Find which side a character fights on (player team first).
   *
   * @return true and sets `out` if found
   */
  [[nodiscard]] bool side_of(int32_t character_id, TeamSide & out) const noexcept;
};

}  // namespace rule_dsl

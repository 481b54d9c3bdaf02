// rule_dsl/runtime/evaluation_context.hpp - Per-call evaluation state
//
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <utility>
#include <variant>

#include "rule_dsl/runtime/battle.hpp"

namespace rule_dsl
{

/// Random source threaded through every evaluation
using RandomSource = std::mt19937;

/// Value bound by FilterList/Map for `Element`
using CurrentElement = std::variant<Character, int32_t, TeamSide, CharacterHP>;

/**
 * Battle view, random source and current element for one evaluation.
 *
 * The context never owns the battle or the random source. List
 * combinators evaluate their per-element operand in a derived context
 * from with_element(); the parent's binding is untouched.
 */
class EvaluationContext
{
public:
  EvaluationContext(const BattleContext & battle, RandomSource & rng)
  : battle_(&battle), rng_(&rng)
  {
  }

  [[nodiscard]] const BattleContext & battle() const noexcept { return *battle_; }
  [[nodiscard]] const Character & acting_character() const noexcept { return battle_->acting; }
  [[nodiscard]] RandomSource & rng() const noexcept { return *rng_; }

  [[nodiscard]] const std::optional<CurrentElement> & current_element() const noexcept
  {
    return element_;
  }

  /**
   * Derive a context that differs only in its current element.
   */
  [[nodiscard]] EvaluationContext with_element(CurrentElement element) const
  {
    EvaluationContext derived(*this);
    derived.element_ = std::move(element);
    return derived;
  }

private:
  const BattleContext * battle_;
  RandomSource * rng_;
  std::optional<CurrentElement> element_;
};

// ============================================================================
// Element Type Names
// ============================================================================

template <typename T>
struct ElementName;

template <>
struct ElementName<Character>
{
  static constexpr const char * value = "Character";
};

template <>
struct ElementName<int32_t>
{
  static constexpr const char * value = "i32";
};

template <>
struct ElementName<TeamSide>
{
  static constexpr const char * value = "TeamSide";
};

template <>
struct ElementName<CharacterHP>
{
  static constexpr const char * value = "CharacterHP";
};

}  // namespace rule_dsl

// rule_dsl/runtime/action.hpp - Decided actions handed to the battle driver
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>


namespace rule_dsl
{

/// MP consumed by one Heal
inline constexpr int32_t k_heal_mp_cost = 10;

/// HP restored by one Heal
inline constexpr int32_t k_heal_amount = 30;

enum class ActionKind : uint8_t {
  Strike,
  Heal,
};

/**
 * Base of the closed action set. kind() names the concrete action.
 */
class Action
{
public:
  virtual ~Action() = default;

  [[nodiscard]] ActionKind kind() const noexcept { return kind_; }
  [[nodiscard]] int32_t target_id() const noexcept { return target_id_; }

  /// Short display form, e.g. "Strike(target=3)"
  [[nodiscard]] std::string describe() const;

protected:
  Action(ActionKind kind, int32_t target_id) : kind_(kind), target_id_(target_id) {}

private:
  ActionKind kind_;
  int32_t target_id_;
};

class StrikeAction : public Action
{
public:
  explicit StrikeAction(int32_t target_id) : Action(ActionKind::Strike, target_id) {}
};

class HealAction : public Action
{
public:
  explicit HealAction(int32_t target_id) : Action(ActionKind::Heal, target_id) {}
};

using ActionPtr = std::unique_ptr<Action>;

}  // namespace rule_dsl

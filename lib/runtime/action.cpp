// rule_dsl/runtime/action.cpp - Decided actions
//
#include "rule_dsl/runtime/action.hpp"

#include <fmt/core.h>

namespace rule_dsl
{

std::string Action::describe() const
{
  switch (kind_) {
    case ActionKind::Strike:
      return fmt::format("Strike(target={})", target_id_);
    case ActionKind::Heal:
      return fmt::format("Heal(target={})", target_id_);
  }
  return "Unknown";
}

}  // namespace rule_dsl

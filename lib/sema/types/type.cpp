// rule_dsl/sema/types/type.cpp - Type context implementation
//
#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
  while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
  return s;
}

}  // namespace

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
{
  i32_ = Type{TypeKind::I32};
  bool_ = Type{TypeKind::Bool};
  string_ = Type{TypeKind::String};
  character_ = Type{TypeKind::Character};
  team_ = Type{TypeKind::Team};
  character_hp_ = Type{TypeKind::CharacterHP};
  team_side_ = Type{TypeKind::TeamSide};
  numeric_ = Type{TypeKind::Numeric};
  action_ = Type{TypeKind::Action};
  condition_ = Type{TypeKind::Condition};
  void_ = Type{TypeKind::Void};
  any_ = Type{TypeKind::Any};
}

const Type * TypeContext::get_simple_type(TypeKind kind) const noexcept
{
  switch (kind) {
    case TypeKind::I32:
      return &i32_;
    case TypeKind::Bool:
      return &bool_;
    case TypeKind::String:
      return &string_;
    case TypeKind::Character:
      return &character_;
    case TypeKind::Team:
      return &team_;
    case TypeKind::CharacterHP:
      return &character_hp_;
    case TypeKind::TeamSide:
      return &team_side_;
    case TypeKind::Numeric:
      return &numeric_;
    case TypeKind::Action:
      return &action_;
    case TypeKind::Condition:
      return &condition_;
    case TypeKind::Void:
      return &void_;
    case TypeKind::Any:
      return &any_;
    case TypeKind::Vec:
    case TypeKind::Option:
    case TypeKind::TypeVar:
      return nullptr;
  }
  return nullptr;
}

const Type * TypeContext::get_collection_type(TypeKind kind, const Type * element_type)
{
  for (const auto & t : composite_types_) {
    if (t.kind == kind && t.element_type == element_type) {
      return &t;
    }
  }

  Type new_type{kind};
  new_type.element_type = element_type;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_vec_type(const Type * element_type)
{
  return get_collection_type(TypeKind::Vec, element_type);
}

const Type * TypeContext::get_option_type(const Type * element_type)
{
  return get_collection_type(TypeKind::Option, element_type);
}

const Type * TypeContext::get_type_var(uint32_t id)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::TypeVar && t.var_id == id) {
      return &t;
    }
  }

  Type new_type{TypeKind::TypeVar};
  new_type.var_id = id;
  if (id >= next_var_id_) {
    next_var_id_ = id + 1;
  }
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::fresh_type_var()
{
  Type new_type{TypeKind::TypeVar};
  new_type.var_id = next_var_id_++;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::lookup_builtin(std::string_view name)
{
  name = trim(name);

  if (name == "i32") return &i32_;
  if (name == "bool") return &bool_;
  if (name == "String") return &string_;
  if (name == "Character") return &character_;
  if (name == "Team") return &team_;
  if (name == "CharacterHP") return &character_hp_;
  if (name == "TeamSide") return &team_side_;
  if (name == "Numeric") return &numeric_;
  if (name == "Action") return &action_;
  if (name == "Condition") return &condition_;
  if (name == "void") return &void_;
  if (name == "any") return &any_;

  // Collections: Vec<...> / Option<...>
  if (name.size() > 2 && name.back() == '>') {
    const size_t open = name.find('<');
    if (open == std::string_view::npos) {
      return nullptr;
    }
    const std::string_view head = name.substr(0, open);
    const std::string_view inner = name.substr(open + 1, name.size() - open - 2);
    const Type * element = lookup_builtin(inner);
    if (element == nullptr) {
      return nullptr;
    }
    if (head == "Vec") return get_vec_type(element);
    if (head == "Option") return get_option_type(element);
  }

  return nullptr;
}

}  // namespace rule_dsl

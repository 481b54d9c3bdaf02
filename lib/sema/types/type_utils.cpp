// rule_dsl/sema/types/type_utils.cpp - Type relation utilities
//
#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

namespace
{

bool is_numeric_like(const Type * t)
{
  return t->kind == TypeKind::Numeric || t->is_numeric_concrete();
}

bool is_condition_like(const Type * t)
{
  return t->kind == TypeKind::Condition || t->kind == TypeKind::Bool;
}

}  // namespace

// ============================================================================
// Type Compatibility
// ============================================================================

bool is_compatible(const Type * expected, const Type * actual)
{
  if (expected == nullptr || actual == nullptr) {
    return false;
  }

  if (expected == actual) {
    return true;
  }

  if (expected->is_any() || actual->is_any()) {
    return true;
  }

  if (expected->is_var() || actual->is_var()) {
    return true;
  }

  if (expected->kind == TypeKind::Numeric || actual->kind == TypeKind::Numeric) {
    return is_numeric_like(expected) && is_numeric_like(actual);
  }

  if (expected->kind == TypeKind::Condition || actual->kind == TypeKind::Condition) {
    return is_condition_like(expected) && is_condition_like(actual);
  }

  if (expected->is_collection() && expected->kind == actual->kind) {
    return is_compatible(expected->element_type, actual->element_type);
  }

  return false;
}

const Type * resolve_to_concrete(TypeContext & types, const Type * type, const Type * hint)
{
  if (type == nullptr) {
    return nullptr;
  }

  switch (type->kind) {
    case TypeKind::Numeric:
      if (hint != nullptr && hint->kind == TypeKind::CharacterHP) {
        return types.character_hp_type();
      }
      return types.i32_type();

    case TypeKind::Any:
      return hint != nullptr ? hint : types.void_type();

    case TypeKind::Vec: {
      const Type * elem_hint = (hint != nullptr && hint->kind == TypeKind::Vec)
                                 ? hint->element_type
                                 : nullptr;
      return types.get_vec_type(resolve_to_concrete(types, type->element_type, elem_hint));
    }

    case TypeKind::Option: {
      const Type * elem_hint = (hint != nullptr && hint->kind == TypeKind::Option)
                                 ? hint->element_type
                                 : nullptr;
      return types.get_option_type(resolve_to_concrete(types, type->element_type, elem_hint));
    }

    default:
      return type;
  }
}

const Type * element_type_of(const Type * type) noexcept
{
  if (type != nullptr && type->is_collection()) {
    return type->element_type;
  }
  return type;
}

std::string to_string(const Type * type)
{
  if (type == nullptr) {
    return "<null>";
  }

  switch (type->kind) {
    case TypeKind::I32:
      return "i32";
    case TypeKind::Bool:
      return "bool";
    case TypeKind::String:
      return "String";
    case TypeKind::Character:
      return "Character";
    case TypeKind::Team:
      return "Team";
    case TypeKind::CharacterHP:
      return "CharacterHP";
    case TypeKind::TeamSide:
      return "TeamSide";
    case TypeKind::Vec:
      return "Vec<" + to_string(type->element_type) + ">";
    case TypeKind::Option:
      return "Option<" + to_string(type->element_type) + ">";
    case TypeKind::Numeric:
      return "Numeric";
    case TypeKind::Action:
      return "Action";
    case TypeKind::Condition:
      return "Condition";
    case TypeKind::Void:
      return "void";
    case TypeKind::Any:
      return "any";
    case TypeKind::TypeVar:
      return "'t" + std::to_string(type->var_id);
  }
  return "<unknown>";
}

}  // namespace rule_dsl

// rule_dsl/codegen/converter_registry.cpp - Converter registry
//
#include "rule_dsl/codegen/converter_registry.hpp"

namespace rule_dsl
{

bool ConverterRegistry::accepts(const Type * requested, const Type * actual)
{
  if (requested == nullptr || actual == nullptr) {
    return false;
  }
  if (requested == actual) {
    return true;
  }

  // An operand left at Numeric is built at whichever representation the
  // parent chose.
  if (actual->kind == TypeKind::Numeric) {
    return requested->is_numeric_concrete();
  }
  if (actual->kind == TypeKind::Condition) {
    return requested->kind == TypeKind::Bool;
  }
  if (requested->kind == TypeKind::Vec && actual->kind == TypeKind::Vec) {
    return accepts(requested->element_type, actual->element_type);
  }
  return false;
}

size_t ConverterRegistry::size() const noexcept
{
  return std::apply(
    [](const auto &... t) { return (t.size() + ... + size_t{0}); }, tables_);
}

TypeKind numeric_operand_kind(const TypedAst * operand, const TypedAst * sibling)
{
  if (operand != nullptr && operand->type->is_numeric_concrete()) {
    return operand->type->kind;
  }
  if (sibling != nullptr && sibling->type->is_numeric_concrete()) {
    return sibling->type->kind;
  }
  if (operand != nullptr && (operand->token->is("NumericMax") || operand->token->is("NumericMin"))) {
    if (const TypedAst * array = operand->child("array")) {
      const Type * element = element_type_of(array->type);
      if (element != nullptr && element->is_numeric_concrete()) {
        return element->kind;
      }
    }
  }
  // Both sides abstract: fall back to the integer representation.
  return TypeKind::I32;
}

void register_builtin_converters(ConverterRegistry & registry)
{
  register_action_converters(registry);
  register_condition_converters(registry);
  register_value_converters(registry);
  register_array_converters(registry);
}

}  // namespace rule_dsl

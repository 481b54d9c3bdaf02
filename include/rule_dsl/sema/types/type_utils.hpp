// rule_dsl/sema/types/type_utils.hpp - Shared type relation utilities
//
// Compatibility, concretization and display helpers used by the checker,
// the unifier and the code generator.
//
#pragma once

#include <string>

#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

// ============================================================================
// Type Compatibility
// ============================================================================

/**
 * Check if a value of type `actual` is accepted where `expected` is required.
 *
 * Rules:
 * - Identical types match
 * - Numeric matches i32, CharacterHP and Numeric (in either position)
 * - Condition matches bool (in either position)
 * - Any matches anything
 * - Vec/Option are compatible element-wise
 * - An unbound type variable matches anything (unification decides later)
 *
 * @param expected The required type
 * @param actual The provided type
 * @return true if compatible
 */
[[nodiscard]] bool is_compatible(const Type * expected, const Type * actual);

/**
 * Resolve an abstract type to a concrete representative.
 *
 * - Numeric → CharacterHP if the hint is CharacterHP, otherwise i32
 * - Any → the hint if given, otherwise void
 * - Vec/Option are resolved element-wise
 * - Every other type resolves to itself
 *
 * @param types Context used to intern rebuilt collection types
 * @param type The type to resolve
 * @param hint Optional concrete type known from the surroundings
 */
[[nodiscard]] const Type * resolve_to_concrete(
  TypeContext & types, const Type * type, const Type * hint = nullptr);

/**
 * Strip one collection layer.
 *
 * @return The element type for Vec/Option, otherwise the type itself
 */
[[nodiscard]] const Type * element_type_of(const Type * type) noexcept;

/**
 * Convert a Type to its display name (e.g. "i32", "Vec<Character>", "'t3").
 */
[[nodiscard]] std::string to_string(const Type * type);

}  // namespace rule_dsl

// rule_dsl/sema/types/type.hpp - Semantic type representation
//
// Represents resolved types for checking, inference and code generation.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <string_view>

namespace rule_dsl
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of semantic type.
 */
enum class TypeKind : uint8_t {
  // Primitive types
  I32,
  Bool,
  String,

  // Domain types
  Character,
  Team,
  CharacterHP,  ///< HP value with a back-reference to its character
  TeamSide,

  // Collections
  Vec,     ///< Vec<T>
  Option,  ///< Option<T>

  // Abstract capabilities
  Numeric,    ///< i32 or CharacterHP
  Action,     ///< result of an action token
  Condition,  ///< boolean-producing token

  // Markers
  Void,
  Any,  ///< wildcard, compatible with everything

  // Inference placeholder
  TypeVar,  ///< 't<N>, bound during unification
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type.
 *
 * Types are interned by TypeContext, so two types are equal iff their
 * pointers are equal.
 */
struct Type
{
  TypeKind kind;

  /// For Vec/Option: element type
  const Type * element_type = nullptr;

  /// For TypeVar: variable id
  uint32_t var_id = 0;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_collection() const noexcept
  {
    return kind == TypeKind::Vec || kind == TypeKind::Option;
  }

  [[nodiscard]] bool is_var() const noexcept { return kind == TypeKind::TypeVar; }

  [[nodiscard]] bool is_any() const noexcept { return kind == TypeKind::Any; }

  /// Check if this is an abstract capability (Numeric, Action, Condition)
  [[nodiscard]] bool is_abstract() const noexcept
  {
    return kind == TypeKind::Numeric || kind == TypeKind::Action || kind == TypeKind::Condition;
  }

  /// Check if this type is a concrete representative of Numeric
  [[nodiscard]] bool is_numeric_concrete() const noexcept
  {
    return kind == TypeKind::I32 || kind == TypeKind::CharacterHP;
  }

  /// Check if this type (or any nested element) is an unbound type variable
  [[nodiscard]] bool has_vars() const noexcept
  {
    if (kind == TypeKind::TypeVar) return true;
    return element_type != nullptr && element_type->has_vars();
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Type context for interning and managing semantic types.
 *
 * Provides singleton instances for built-in types, creates interned
 * collection types on demand and hands out fresh type variables.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * i32_type() const noexcept { return &i32_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * character_type() const noexcept { return &character_; }
  [[nodiscard]] const Type * team_type() const noexcept { return &team_; }
  [[nodiscard]] const Type * character_hp_type() const noexcept { return &character_hp_; }
  [[nodiscard]] const Type * team_side_type() const noexcept { return &team_side_; }
  [[nodiscard]] const Type * numeric_type() const noexcept { return &numeric_; }
  [[nodiscard]] const Type * action_type() const noexcept { return &action_; }
  [[nodiscard]] const Type * condition_type() const noexcept { return &condition_; }
  [[nodiscard]] const Type * void_type() const noexcept { return &void_; }
  [[nodiscard]] const Type * any_type() const noexcept { return &any_; }

  /// Get the singleton for a kind without parameters (nullptr for Vec/Option/TypeVar)
  [[nodiscard]] const Type * get_simple_type(TypeKind kind) const noexcept;

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  /// Get Vec<T>
  const Type * get_vec_type(const Type * element_type);

  /// Get Option<T>
  const Type * get_option_type(const Type * element_type);

  /// Get the interned variable type for an id
  const Type * get_type_var(uint32_t id);

  /// Create a type variable with an id never handed out before
  const Type * fresh_type_var();

  // ===========================================================================
  // Type Lookup by Name
  // ===========================================================================

  /**
   * Parse a type from its display name.
   *
   * Accepts the names produced by to_string(), including nested
   * collections such as "Vec<Option<i32>>".
   *
   * @return The interned type, or nullptr if the name is not a type
   */
  [[nodiscard]] const Type * lookup_builtin(std::string_view name);

private:
  const Type * get_collection_type(TypeKind kind, const Type * element_type);

  // Built-in type singletons
  Type i32_, bool_, string_;
  Type character_, team_, character_hp_, team_side_;
  Type numeric_, action_, condition_;
  Type void_, any_;

  uint32_t next_var_id_ = 0;

  // Arena for composite types
  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers to interned composite types are handed out widely,
  // so the container must keep element addresses stable.
  std::pmr::deque<Type> composite_types_{&arena_};
};

}  // namespace rule_dsl

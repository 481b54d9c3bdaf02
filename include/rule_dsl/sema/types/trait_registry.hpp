// rule_dsl/sema/types/trait_registry.hpp - Abstract capability registry
//
// Records which traits (Numeric, Eq, Ord, Collection, ...) exist, their
// supertraits, and which types implement them.
//
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

// ============================================================================
// Builtin Trait Names
// ============================================================================

inline constexpr std::string_view k_trait_numeric = "Numeric";
inline constexpr std::string_view k_trait_eq = "Eq";
inline constexpr std::string_view k_trait_ord = "Ord";
inline constexpr std::string_view k_trait_collection = "Collection";
inline constexpr std::string_view k_trait_show = "Show";
inline constexpr std::string_view k_trait_collectable = "Collectable";

// ============================================================================
// Trait Definition
// ============================================================================

/**
 * A trait declaration.
 */
struct TraitDef
{
  std::string name;

  /// Traits every implementor of this trait also implements
  std::vector<std::string> supertraits;

  /// Type parameter names (Collection<T>)
  std::vector<std::string> params;

  std::string description;
};

// ============================================================================
// Trait Registry
// ============================================================================

/**
 * Trait facts for the checker's post-solve bound pass.
 *
 * Implementations are recorded per interned type, or per type kind for
 * blanket implementations such as `impl<T> Collection for Vec<T>`.
 */
class TraitRegistry
{
public:
  TraitRegistry() = default;

  /**
   * Register the builtin traits and implementations.
   *
   * @param types Context providing the interned builtin types
   */
  void register_builtins(TypeContext & types);

  // ===========================================================================
  // Definition
  // ===========================================================================

  /**
   * Define a trait.
   *
   * @return true if defined, false if a trait with that name already exists
   */
  bool define(TraitDef def);

  /**
   * Record that `type` implements `trait`.
   *
   * @return false if the trait is unknown
   */
  bool add_impl(std::string_view trait, const Type * type);

  /**
   * Record that every type of `kind` implements `trait`.
   *
   * @return false if the trait is unknown
   */
  bool add_kind_impl(std::string_view trait, TypeKind kind);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const TraitDef * lookup(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  /**
   * Check whether `type` implements `trait`, directly or through the
   * supertrait closure of a trait it implements.
   *
   * `any` and unbound type variables satisfy every trait.
   */
  [[nodiscard]] bool implements(const Type * type, std::string_view trait) const;

  /**
   * All traits `type` implements, supertraits included, sorted by name.
   */
  [[nodiscard]] std::vector<std::string> traits_for(const Type * type) const;

  /**
   * Check a single bound.
   *
   * @return A TraitBoundError if `type` does not implement `trait`
   */
  [[nodiscard]] std::optional<CompileError> check_bound(
    const Type * type, std::string_view trait) const;

  [[nodiscard]] size_t size() const noexcept { return traits_.size(); }

private:
  struct TraitEntry
  {
    TraitDef def;
    std::set<const Type *> types;
    std::set<TypeKind> kinds;
  };

  [[nodiscard]] bool implements_directly(const TraitEntry & entry, const Type * type) const;

  void add_with_supertraits(std::string_view trait, std::set<std::string> & out) const;

  std::map<std::string, TraitEntry, std::less<>> traits_;
};

}  // namespace rule_dsl

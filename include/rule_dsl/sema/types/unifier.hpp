// rule_dsl/sema/types/unifier.hpp - Type variable unification
//
// Substitution, deferred constraints, occurs check and the
// generalize/instantiate pair used for generic token signatures.
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

/// Type variable id -> bound type
using Substitution = std::unordered_map<uint32_t, const Type *>;

/**
 * A deferred equality between an expected and an actual type, with the
 * path it was generated at.
 */
struct TypeConstraint
{
  const Type * expected = nullptr;
  const Type * actual = nullptr;
  std::vector<PathSegment> path;
  const Token * token = nullptr;
};

// ============================================================================
// Schemes
// ============================================================================

/**
 * A type quantified over some of its variables (forall vars. type).
 */
struct TypeScheme
{
  std::vector<const Type *> vars;
  const Type * type = nullptr;

  [[nodiscard]] bool is_mono() const noexcept { return vars.empty(); }
};

/**
 * Name -> scheme environment.
 */
class TypeEnv
{
public:
  void bind(std::string name, TypeScheme scheme) { bindings_[std::move(name)] = std::move(scheme); }

  [[nodiscard]] const TypeScheme * lookup(std::string_view name) const
  {
    auto it = bindings_.find(name);
    return it != bindings_.end() ? &it->second : nullptr;
  }

  /// Ids of the type variables free in the environment
  [[nodiscard]] std::vector<uint32_t> free_vars() const;

  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }

private:
  std::map<std::string, TypeScheme, std::less<>> bindings_;
};

// ============================================================================
// Unifier
// ============================================================================

/**
 * Unification engine.
 *
 * Rules (after resolving both sides through the substitution):
 * - identical types unify
 * - a variable binds to the other side, subject to the occurs check
 * - any unifies with anything
 * - Numeric unifies with i32, CharacterHP and Numeric
 * - Condition unifies with bool
 * - Vec/Option unify element-wise
 */
class Unifier
{
public:
  explicit Unifier(TypeContext & types) : types_(types) {}

  /// Clear the substitution and all pending constraints
  void reset();

  void add_constraint(TypeConstraint constraint) { constraints_.push_back(std::move(constraint)); }

  [[nodiscard]] size_t pending() const noexcept { return constraints_.size(); }

  /**
   * Unify two types, extending the substitution.
   *
   * @return An error without path information on failure
   */
  [[nodiscard]] std::optional<CompileError> unify(const Type * expected, const Type * actual);

  /**
   * Drain the pending constraints in one pass.
   *
   * The first failure is returned with the failing constraint's path and
   * token attached. Constraints after it are dropped.
   */
  [[nodiscard]] std::optional<CompileError> solve_constraints();

  /// Apply the current substitution, rebuilding collections as needed
  [[nodiscard]] const Type * apply(const Type * type);

  /// Check whether the variable `var_id` occurs in `type`
  [[nodiscard]] bool occurs(uint32_t var_id, const Type * type);

  /**
   * Quantify over the variables of `type` that are not free in `env`.
   */
  [[nodiscard]] TypeScheme generalize(const TypeEnv & env, const Type * type);

  /**
   * Replace every quantified variable of `scheme` with a fresh one.
   *
   * @param mapping If given, receives old id -> fresh variable
   */
  [[nodiscard]] const Type * instantiate(const TypeScheme & scheme, Substitution * mapping = nullptr);

  /// Replace variables per `mapping` without consulting the substitution
  [[nodiscard]] const Type * substitute(const Type * type, const Substitution & mapping);

  [[nodiscard]] const Substitution & substitution() const noexcept { return subst_; }

private:
  [[nodiscard]] const Type * resolve(const Type * type) const;

  void collect_vars(const Type * type, std::vector<uint32_t> & out);

  TypeContext & types_;
  Substitution subst_;
  std::vector<TypeConstraint> constraints_;
};

}  // namespace rule_dsl

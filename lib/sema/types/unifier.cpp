// rule_dsl/sema/types/unifier.cpp - Unification implementation
//
#include "rule_dsl/sema/types/unifier.hpp"

#include <algorithm>
#include <utility>

#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

// ============================================================================
// TypeEnv
// ============================================================================

std::vector<uint32_t> TypeEnv::free_vars() const
{
  std::vector<uint32_t> out;
  for (const auto & [name, scheme] : bindings_) {
    std::vector<const Type *> work{scheme.type};
    while (!work.empty()) {
      const Type * t = work.back();
      work.pop_back();
      if (t == nullptr) continue;
      if (t->is_var()) {
        const bool quantified = std::any_of(
          scheme.vars.begin(), scheme.vars.end(),
          [&](const Type * v) { return v->var_id == t->var_id; });
        if (!quantified && std::find(out.begin(), out.end(), t->var_id) == out.end()) {
          out.push_back(t->var_id);
        }
      }
      work.push_back(t->element_type);
    }
  }
  return out;
}

// ============================================================================
// Unifier
// ============================================================================

void Unifier::reset()
{
  subst_.clear();
  constraints_.clear();
}

const Type * Unifier::resolve(const Type * type) const
{
  while (type != nullptr && type->is_var()) {
    auto it = subst_.find(type->var_id);
    if (it == subst_.end()) break;
    type = it->second;
  }
  return type;
}

const Type * Unifier::apply(const Type * type)
{
  type = resolve(type);
  if (type == nullptr) return nullptr;

  switch (type->kind) {
    case TypeKind::Vec:
      return types_.get_vec_type(apply(type->element_type));
    case TypeKind::Option:
      return types_.get_option_type(apply(type->element_type));
    default:
      return type;
  }
}

bool Unifier::occurs(uint32_t var_id, const Type * type)
{
  type = resolve(type);
  if (type == nullptr) return false;
  if (type->is_var()) return type->var_id == var_id;
  return type->element_type != nullptr && occurs(var_id, type->element_type);
}

std::optional<CompileError> Unifier::unify(const Type * expected, const Type * actual)
{
  const Type * a = resolve(expected);
  const Type * b = resolve(actual);

  if (a == b) {
    return std::nullopt;
  }

  if (a->is_var() || b->is_var()) {
    const Type * var = a->is_var() ? a : b;
    const Type * other = a->is_var() ? b : a;
    if (occurs(var->var_id, other)) {
      return CompileError::infinite_type(var, apply(other));
    }
    subst_[var->var_id] = other;
    return std::nullopt;
  }

  if (a->is_any() || b->is_any()) {
    return std::nullopt;
  }

  if (a->kind == TypeKind::Numeric || b->kind == TypeKind::Numeric) {
    const Type * other = a->kind == TypeKind::Numeric ? b : a;
    if (other->kind == TypeKind::Numeric || other->is_numeric_concrete()) {
      return std::nullopt;
    }
    return CompileError::type_mismatch(apply(a), apply(b));
  }

  if (a->kind == TypeKind::Condition || b->kind == TypeKind::Condition) {
    const Type * other = a->kind == TypeKind::Condition ? b : a;
    if (other->kind == TypeKind::Condition || other->kind == TypeKind::Bool) {
      return std::nullopt;
    }
    return CompileError::type_mismatch(apply(a), apply(b));
  }

  if (a->is_collection() && a->kind == b->kind) {
    if (auto err = unify(a->element_type, b->element_type)) {
      // Report the whole collection rather than the element pair.
      if (err->kind() == CompileErrorKind::TypeMismatch) {
        return CompileError::type_mismatch(apply(a), apply(b));
      }
      return err;
    }
    return std::nullopt;
  }

  return CompileError::type_mismatch(apply(a), apply(b));
}

std::optional<CompileError> Unifier::solve_constraints()
{
  std::vector<TypeConstraint> pending;
  pending.swap(constraints_);

  for (auto & c : pending) {
    if (auto err = unify(c.expected, c.actual)) {
      err->with_path(std::move(c.path)).with_token(c.token);
      return err;
    }
  }
  return std::nullopt;
}

void Unifier::collect_vars(const Type * type, std::vector<uint32_t> & out)
{
  type = resolve(type);
  if (type == nullptr) return;
  if (type->is_var()) {
    if (std::find(out.begin(), out.end(), type->var_id) == out.end()) {
      out.push_back(type->var_id);
    }
    return;
  }
  collect_vars(type->element_type, out);
}

TypeScheme Unifier::generalize(const TypeEnv & env, const Type * type)
{
  const Type * applied = apply(type);
  std::vector<uint32_t> vars;
  collect_vars(applied, vars);

  const std::vector<uint32_t> env_vars = env.free_vars();
  TypeScheme scheme;
  scheme.type = applied;
  for (uint32_t id : vars) {
    if (std::find(env_vars.begin(), env_vars.end(), id) == env_vars.end()) {
      scheme.vars.push_back(types_.get_type_var(id));
    }
  }
  return scheme;
}

const Type * Unifier::instantiate(const TypeScheme & scheme, Substitution * mapping)
{
  Substitution fresh;
  for (const Type * v : scheme.vars) {
    fresh[v->var_id] = types_.fresh_type_var();
  }
  const Type * result = substitute(scheme.type, fresh);
  if (mapping != nullptr) {
    *mapping = std::move(fresh);
  }
  return result;
}

const Type * Unifier::substitute(const Type * type, const Substitution & mapping)
{
  if (type == nullptr) return nullptr;

  switch (type->kind) {
    case TypeKind::TypeVar: {
      auto it = mapping.find(type->var_id);
      return it != mapping.end() ? it->second : type;
    }
    case TypeKind::Vec:
      return types_.get_vec_type(substitute(type->element_type, mapping));
    case TypeKind::Option:
      return types_.get_option_type(substitute(type->element_type, mapping));
    default:
      return type;
  }
}

}  // namespace rule_dsl

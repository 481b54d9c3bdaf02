// rule_dsl/sema/types/type_checker.cpp - Unification-based token checker
//
#include "rule_dsl/sema/types/type_checker.hpp"

#include <string>
#include <utility>

#include "rule_dsl/sema/analysis/token_cycle_checker.hpp"
#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

namespace
{

/// RAII push of a path segment
class PathScope
{
public:
  PathScope(std::vector<PathSegment> & path, std::string_view token, std::string_view arg)
  : path_(path)
  {
    path_.push_back(PathSegment{std::string(token), std::string(arg)});
  }
  ~PathScope() { path_.pop_back(); }

  PathScope(const PathScope &) = delete;
  PathScope & operator=(const PathScope &) = delete;

private:
  std::vector<PathSegment> & path_;
};

/// RAII push of an element context
class ElementScope
{
public:
  ElementScope(std::vector<const Type *> & stack, const Type * element) : stack_(stack)
  {
    stack_.push_back(element);
  }
  ~ElementScope() { stack_.pop_back(); }

  ElementScope(const ElementScope &) = delete;
  ElementScope & operator=(const ElementScope &) = delete;

private:
  std::vector<const Type *> & stack_;
};

void collect_unbound(const Type * type, std::vector<const Type *> & out)
{
  if (type == nullptr) return;
  if (type->is_var()) {
    out.push_back(type);
    return;
  }
  collect_unbound(type->element_type, out);
}

std::string render_path(const std::vector<PathSegment> & path)
{
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) out += " -> ";
    out += path[i].to_string();
  }
  return out;
}

}  // namespace

TypeChecker::TypeChecker(
  TypeContext & types, const TokenRegistry & tokens, const TraitRegistry & traits)
: types_(types), tokens_(tokens), unifier_(types), bounds_(traits)
{
}

// ============================================================================
// Entry Point
// ============================================================================

CheckResult TypeChecker::check(const Token * root, const Type * expected)
{
  if (auto err = TokenCycleChecker{}.check(root)) {
    return CheckResult::fail(std::move(*err));
  }

  unifier_.reset();
  bounds_.reset();
  path_.clear();
  element_stack_.clear();

  CheckResult result = infer(root);
  if (!result.success()) {
    return result;
  }

  if (auto err = unifier_.solve_constraints()) {
    return CheckResult::fail(std::move(*err));
  }

  if (auto err = finalize(*result.ast)) {
    return CheckResult::fail(std::move(*err));
  }

  if (auto err = bounds_.check(unifier_)) {
    return CheckResult::fail(std::move(*err));
  }

  if (expected != nullptr && !is_compatible(expected, result.ast->type)) {
    CompileError err = CompileError::type_mismatch(expected, result.ast->type);
    err.with_token(root);
    return CheckResult::fail(std::move(err));
  }

  return result;
}

// ============================================================================
// Inference
// ============================================================================

CompileError TypeChecker::at_current_path(CompileError err, const Token * token) const
{
  err.with_path(path_).with_token(token);
  return err;
}

CheckResult TypeChecker::infer_element(const Token * token)
{
  if (element_stack_.empty()) {
    return CheckResult::fail(at_current_path(
      CompileError::unresolved_type("Element used outside of list context"), token));
  }

  // The stack holds element types; the collection layer was stripped on push.
  auto node = std::make_unique<TypedAst>();
  node->token = token;
  node->type = unifier_.apply(element_stack_.back());
  return CheckResult::ok(std::move(node));
}

CheckResult TypeChecker::infer(const Token * token)
{
  if (token->is(k_element_token)) {
    return infer_element(token);
  }

  const TokenSignature * sig = tokens_.lookup(token->type());
  if (sig == nullptr) {
    return CheckResult::fail(
      at_current_path(CompileError::undefined_token(token->type()), token));
  }

  if (token->args().size() > sig->arguments.size()) {
    return CheckResult::fail(at_current_path(
      CompileError::argument_count(token->type(), sig->arguments.size(), token->args().size()),
      token));
  }

  if (sig->literal_field && !token->literal()) {
    return CheckResult::fail(
      at_current_path(CompileError::missing_field(token->type(), *sig->literal_field), token));
  }
  if (!sig->literal_field && token->literal()) {
    return CheckResult::fail(at_current_path(
      CompileError::argument_count(
        token->type(), sig->arguments.size(), token->args().size() + 1),
      token));
  }

  // Instantiate the generic parameters with fresh variables.
  TypeScheme scheme;
  scheme.type = sig->output;
  for (const auto & g : sig->generics) {
    scheme.vars.push_back(g.var);
  }
  Substitution fresh;
  const Type * output = unifier_.instantiate(scheme, &fresh);

  for (const auto & g : sig->generics) {
    for (const auto & bound : g.bounds) {
      bounds_.add_obligation(TraitObligation{fresh.at(g.var->var_id), bound, path_, token});
    }
  }

  auto node = std::make_unique<TypedAst>();
  node->token = token;

  for (const auto & param : sig->arguments) {
    const Token * child = token->arg(param.name);
    if (child == nullptr) {
      if (!param.required) continue;
      PathScope scope(path_, token->type(), param.name);
      return CheckResult::fail(
        at_current_path(CompileError::missing_field(token->type(), param.name), token));
    }

    const Type * expected = unifier_.substitute(param.type, fresh);

    PathScope scope(path_, token->type(), param.name);

    CheckResult child_result;
    if (param.element_source) {
      if (auto err = unifier_.solve_constraints()) {
        return CheckResult::fail(std::move(*err));
      }

      const ArgumentSignature * source = sig->argument(*param.element_source);
      const Type * source_type = nullptr;
      if (source != nullptr) {
        source_type = unifier_.apply(unifier_.substitute(source->type, fresh));
      }
      if (source_type == nullptr || !source_type->is_collection()) {
        if (const TypedAst * sibling = node->child(*param.element_source)) {
          source_type = unifier_.apply(sibling->type);
        }
      }

      ElementScope element_scope(element_stack_, element_type_of(source_type));
      child_result = infer(child);
    } else {
      child_result = infer(child);
    }

    if (!child_result.success()) {
      return child_result;
    }

    if (auto err = constrain_argument(expected, child_result.ast->type, child)) {
      return CheckResult::fail(std::move(*err));
    }

    node->children.emplace_back(param.name, std::move(child_result.ast));
  }

  node->type = output;
  return CheckResult::ok(std::move(node));
}

std::optional<CompileError> TypeChecker::constrain_argument(
  const Type * expected, const Type * actual, const Token * child)
{
  if (expected->kind == TypeKind::Numeric) {
    const Type * resolved = unifier_.apply(actual);
    if (resolved->is_var()) {
      bounds_.add_obligation(
        TraitObligation{resolved, std::string(k_trait_numeric), path_, child});
      return std::nullopt;
    }
    if (!is_compatible(expected, resolved)) {
      return at_current_path(CompileError::type_mismatch(expected, resolved), child);
    }
    return std::nullopt;
  }

  if (expected->is_any() || actual->is_any()) {
    return std::nullopt;
  }

  if (expected->kind == TypeKind::Vec && expected->element_type->is_any()) {
    const Type * resolved = unifier_.apply(actual);
    if (resolved->kind != TypeKind::Vec && !resolved->is_var()) {
      return at_current_path(CompileError::type_mismatch(expected, resolved), child);
    }
    return std::nullopt;
  }

  unifier_.add_constraint(TypeConstraint{expected, actual, path_, child});
  return std::nullopt;
}

// ============================================================================
// Finalization
// ============================================================================

std::optional<CompileError> TypeChecker::finalize(TypedAst & node)
{
  const Type * type = unifier_.apply(node.type);

  if (type->has_vars()) {
    std::vector<const Type *> unbound;
    collect_unbound(type, unbound);
    for (const Type * var : unbound) {
      if (bounds_.has_bound(unifier_, var, k_trait_numeric)) {
        if (auto err = unifier_.unify(var, types_.numeric_type())) {
          return at_current_path(std::move(*err), node.token);
        }
      }
    }
    type = unifier_.apply(type);
  }

  if (type->has_vars()) {
    std::string context = path_.empty() ? std::string(node.kind())
                                        : render_path(path_);
    return at_current_path(
      CompileError::unresolved_type(to_string(type) + " in " + context), node.token);
  }

  node.type = type;

  for (auto & [name, child] : node.children) {
    PathScope scope(path_, node.kind(), name);
    if (auto err = finalize(*child)) {
      return err;
    }
  }
  return std::nullopt;
}

}  // namespace rule_dsl

// rule_dsl/sema/types/trait_registry.cpp - Trait registry implementation
//
#include "rule_dsl/sema/types/trait_registry.hpp"

#include <utility>

namespace rule_dsl
{

void TraitRegistry::register_builtins(TypeContext & types)
{
  define(TraitDef{std::string(k_trait_numeric), {}, {}, "values usable in arithmetic comparisons"});
  define(TraitDef{std::string(k_trait_eq), {}, {}, "values comparable for equality"});
  define(TraitDef{std::string(k_trait_ord), {std::string(k_trait_eq)}, {}, "totally ordered values"});
  define(TraitDef{std::string(k_trait_collection), {}, {"T"}, "sequences of T"});
  define(TraitDef{std::string(k_trait_show), {}, {}, "values with a display form"});
  define(TraitDef{
    std::string(k_trait_collectable), {}, {}, "values a runtime array can hold"});

  add_impl(k_trait_numeric, types.i32_type());
  add_impl(k_trait_numeric, types.character_hp_type());

  for (const Type * t :
       {types.i32_type(), types.bool_type(), types.string_type(), types.character_type(),
        types.team_type(), types.character_hp_type(), types.team_side_type()}) {
    add_impl(k_trait_eq, t);
    add_impl(k_trait_show, t);
  }

  // Characters are ordered by their current HP.
  add_impl(k_trait_ord, types.i32_type());
  add_impl(k_trait_ord, types.character_hp_type());
  add_impl(k_trait_ord, types.character_type());

  add_kind_impl(k_trait_collection, TypeKind::Vec);

  for (const Type * t :
       {types.character_type(), types.i32_type(), types.character_hp_type(),
        types.team_side_type()}) {
    add_impl(k_trait_collectable, t);
  }
}

bool TraitRegistry::define(TraitDef def)
{
  std::string name = def.name;
  auto [it, inserted] = traits_.emplace(std::move(name), TraitEntry{std::move(def), {}, {}});
  return inserted;
}

bool TraitRegistry::add_impl(std::string_view trait, const Type * type)
{
  auto it = traits_.find(trait);
  if (it == traits_.end()) {
    return false;
  }
  it->second.types.insert(type);
  return true;
}

bool TraitRegistry::add_kind_impl(std::string_view trait, TypeKind kind)
{
  auto it = traits_.find(trait);
  if (it == traits_.end()) {
    return false;
  }
  it->second.kinds.insert(kind);
  return true;
}

const TraitDef * TraitRegistry::lookup(std::string_view name) const
{
  auto it = traits_.find(name);
  return it != traits_.end() ? &it->second.def : nullptr;
}

bool TraitRegistry::implements_directly(const TraitEntry & entry, const Type * type) const
{
  return entry.types.count(type) > 0 || entry.kinds.count(type->kind) > 0;
}

void TraitRegistry::add_with_supertraits(std::string_view trait, std::set<std::string> & out) const
{
  if (!out.insert(std::string(trait)).second) {
    return;
  }
  const TraitDef * def = lookup(trait);
  if (def == nullptr) {
    return;
  }
  for (const auto & super : def->supertraits) {
    add_with_supertraits(super, out);
  }
}

bool TraitRegistry::implements(const Type * type, std::string_view trait) const
{
  if (type == nullptr) {
    return false;
  }
  if (type->is_any() || type->is_var()) {
    return true;
  }

  // The abstract Numeric marker stands for its implementors.
  if (type->kind == TypeKind::Numeric && trait == k_trait_numeric) {
    return true;
  }

  for (const auto & name : traits_for(type)) {
    if (name == trait) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> TraitRegistry::traits_for(const Type * type) const
{
  std::set<std::string> closure;
  if (type == nullptr) {
    return {};
  }

  for (const auto & [name, entry] : traits_) {
    if (implements_directly(entry, type)) {
      add_with_supertraits(name, closure);
    }
  }

  return {closure.begin(), closure.end()};
}

std::optional<CompileError> TraitRegistry::check_bound(
  const Type * type, std::string_view trait) const
{
  if (implements(type, trait)) {
    return std::nullopt;
  }
  return CompileError::trait_bound(type, trait, traits_for(type));
}

}  // namespace rule_dsl

// rule_dsl/sema/resolution/token_registry.cpp - Builtin token signatures
//
#include "rule_dsl/sema/resolution/token_registry.hpp"

#include <utility>

#include "rule_dsl/sema/types/trait_registry.hpp"
#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

namespace
{

ArgumentSignature arg(std::string name, const Type * type)
{
  return ArgumentSignature{std::move(name), type, true, std::nullopt};
}

ArgumentSignature scoped_arg(std::string name, const Type * type, std::string source)
{
  return ArgumentSignature{std::move(name), type, true, std::move(source)};
}

TokenSignature simple(
  std::string name, std::vector<ArgumentSignature> args, const Type * output,
  std::string description)
{
  TokenSignature sig;
  sig.name = std::move(name);
  sig.arguments = std::move(args);
  sig.output = output;
  sig.description = std::move(description);
  return sig;
}

}  // namespace

void TokenRegistry::register_builtins(TypeContext & types)
{
  const Type * i32 = types.i32_type();
  const Type * boolean = types.bool_type();
  const Type * character = types.character_type();
  const Type * character_hp = types.character_hp_type();
  const Type * team_side = types.team_side_type();
  const Type * numeric = types.numeric_type();
  const Type * action = types.action_type();

  // --- Actions ---------------------------------------------------------------
  define(simple("Strike", {arg("target", character)}, action, "attack the target"));
  define(simple("Heal", {arg("target", character)}, action, "heal the target for MP"));
  define(simple(
    "Check", {arg("condition", boolean), arg("then_action", action)}, action,
    "run then_action when condition holds, otherwise skip the rule"));

  // --- Conditions ------------------------------------------------------------
  define(simple("TrueOrFalseRandom", {}, boolean, "fair coin flip"));
  define(simple(
    "GreaterThan", {arg("left", numeric), arg("right", numeric)}, boolean, "left > right"));
  define(simple("LessThan", {arg("left", numeric), arg("right", numeric)}, boolean, "left < right"));
  {
    const Type * t = types.fresh_type_var();
    TokenSignature sig = simple("Eq", {arg("left", t), arg("right", t)}, boolean, "left == right");
    sig.generics.push_back(GenericParam{"T", t, {std::string(k_trait_eq)}});
    define(std::move(sig));
  }

  // --- Characters and teams --------------------------------------------------
  define(simple("ActingCharacter", {}, character, "the character taking its turn"));
  define(simple(
    "AllCharacters", {}, types.get_vec_type(character), "every character on both teams"));
  define(simple(
    "CharacterToHp", {arg("character", character)}, character_hp, "HP of a character"));
  define(simple(
    "CharacterHpToCharacter", {arg("character_hp", character_hp)}, character,
    "owner of an HP value"));
  define(simple(
    "CharacterTeam", {arg("character", character)}, team_side, "side a character fights on"));
  define(simple(
    "TeamMembers", {arg("team_side", team_side)}, types.get_vec_type(character),
    "members of a side"));
  define(simple("AllTeamSides", {}, types.get_vec_type(team_side), "both sides"));
  define(simple("Enemy", {}, team_side, "the enemy side"));
  define(simple("Hero", {}, team_side, "the player side"));

  // --- Literals --------------------------------------------------------------
  {
    TokenSignature sig = simple("Number", {}, i32, "integer literal");
    sig.literal_field = "value";
    define(std::move(sig));
  }

  // --- Collections -----------------------------------------------------------
  {
    const Type * t = types.fresh_type_var();
    TokenSignature sig =
      simple("RandomPick", {arg("array", types.get_vec_type(t))}, t, "uniform random element");
    sig.generics.push_back(GenericParam{"T", t, {}});
    define(std::move(sig));
  }
  {
    const Type * t = types.fresh_type_var();
    const Type * vec_t = types.get_vec_type(t);
    TokenSignature sig = simple(
      "FilterList", {arg("array", vec_t), scoped_arg("condition", boolean, "array")}, vec_t,
      "elements for which condition holds");
    sig.generics.push_back(GenericParam{"T", t, {}});
    define(std::move(sig));
  }
  {
    const Type * t = types.fresh_type_var();
    const Type * u = types.fresh_type_var();
    TokenSignature sig = simple(
      "Map", {arg("array", types.get_vec_type(t)), scoped_arg("transform", u, "array")},
      types.get_vec_type(u), "transform applied to every element");
    sig.generics.push_back(GenericParam{"T", t, {}});
    sig.generics.push_back(GenericParam{"U", u, {std::string(k_trait_collectable)}});
    define(std::move(sig));
  }

  const std::pair<const char *, const char *> ordered[] = {
    {"Max", "largest element"},
    {"Min", "smallest element"},
  };
  for (const auto & [name, description] : ordered) {
    const Type * t = types.fresh_type_var();
    TokenSignature sig = simple(name, {arg("array", types.get_vec_type(t))}, t, description);
    sig.generics.push_back(GenericParam{"T", t, {std::string(k_trait_ord)}});
    define(std::move(sig));
  }

  const std::pair<const char *, const char *> numeric_ordered[] = {
    {"NumericMax", "largest numeric element"},
    {"NumericMin", "smallest numeric element"},
  };
  for (const auto & [name, description] : numeric_ordered) {
    const Type * t = types.fresh_type_var();
    TokenSignature sig = simple(name, {arg("array", types.get_vec_type(t))}, t, description);
    sig.generics.push_back(GenericParam{"T", t, {std::string(k_trait_numeric)}});
    define(std::move(sig));
  }
}

bool TokenRegistry::define(TokenSignature signature)
{
  std::string name = signature.name;
  auto [it, inserted] = signatures_.emplace(std::move(name), std::move(signature));
  return inserted;
}

const TokenSignature * TokenRegistry::lookup(std::string_view name) const
{
  auto it = signatures_.find(name);
  return it != signatures_.end() ? &it->second : nullptr;
}

std::vector<std::string> TokenRegistry::token_names() const
{
  std::vector<std::string> names;
  names.reserve(signatures_.size());
  for (const auto & [name, sig] : signatures_) {
    names.push_back(name);
  }
  return names;
}

std::string to_string(const TokenSignature & signature)
{
  // Generic variables print by parameter name instead of 'tN.
  auto type_name = [&](const Type * type) {
    std::string out = to_string(type);
    for (const auto & g : signature.generics) {
      const std::string var = to_string(g.var);
      for (size_t pos = out.find(var); pos != std::string::npos; pos = out.find(var, pos)) {
        const size_t end = pos + var.size();
        if (end < out.size() && out[end] >= '0' && out[end] <= '9') {
          pos = end;
          continue;
        }
        out.replace(pos, var.size(), g.name);
        pos += g.name.size();
      }
    }
    return out;
  };

  std::string out = signature.name;
  if (signature.is_generic()) {
    out += "<";
    for (size_t i = 0; i < signature.generics.size(); ++i) {
      const auto & g = signature.generics[i];
      if (i > 0) out += ", ";
      out += g.name;
      for (size_t b = 0; b < g.bounds.size(); ++b) {
        out += (b == 0 ? ": " : " + ");
        out += g.bounds[b];
      }
    }
    out += ">";
  }

  out += "(";
  bool first = true;
  for (const auto & a : signature.arguments) {
    if (!first) out += ", ";
    first = false;
    out += a.name + ": " + type_name(a.type);
  }
  if (signature.literal_field) {
    if (!first) out += ", ";
    out += *signature.literal_field + ": i32";
  }
  out += ") -> " + type_name(signature.output);
  return out;
}

}  // namespace rule_dsl

// rule_dsl/sema/resolution/token_registry.hpp - Token signature table
//
// Per-kind schema of every builtin token: generic parameters with trait
// bounds, ordered argument signatures, an optional literal field and the
// declared output type.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

// ============================================================================
// Signatures
// ============================================================================

/**
 * One named operand slot of a token kind.
 */
struct ArgumentSignature
{
  std::string name;
  const Type * type = nullptr;
  bool required = true;

  /// Sibling argument whose element type is pushed as the current element
  /// while this argument is checked (FilterList.condition, Map.transform)
  std::optional<std::string> element_source;
};

/**
 * A generic parameter of a token kind.
 *
 * The parameter is represented by a type variable that occurs in the
 * argument and output types. Instantiation replaces it with a fresh one.
 */
struct GenericParam
{
  std::string name;
  const Type * var = nullptr;
  std::vector<std::string> bounds;
};

struct TokenSignature
{
  std::string name;
  std::vector<GenericParam> generics;
  std::vector<ArgumentSignature> arguments;

  /// Name of the inline literal field (Number's "value")
  std::optional<std::string> literal_field;

  const Type * output = nullptr;

  std::string description;

  [[nodiscard]] const ArgumentSignature * argument(std::string_view arg_name) const noexcept
  {
    for (const auto & a : arguments) {
      if (a.name == arg_name) {
        return &a;
      }
    }
    return nullptr;
  }

  [[nodiscard]] bool is_generic() const noexcept { return !generics.empty(); }
};

// ============================================================================
// Token Registry
// ============================================================================

/**
 * Token kind table.
 *
 * The kind `Element` is never registered: its type comes from the
 * element context of the enclosing FilterList or Map.
 */
class TokenRegistry
{
public:
  TokenRegistry() = default;

  /**
   * Register every builtin token kind.
   *
   * @param types Context used for the declared types and generic variables
   */
  void register_builtins(TypeContext & types);

  /**
   * Define a token signature.
   *
   * @return true if defined, false if the name already exists
   */
  bool define(TokenSignature signature);

  /**
   * Look up a signature by kind name.
   *
   * @return Pointer to the signature if found, nullptr otherwise
   */
  [[nodiscard]] const TokenSignature * lookup(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  /// All registered kind names, sorted
  [[nodiscard]] std::vector<std::string> token_names() const;

  [[nodiscard]] size_t size() const noexcept { return signatures_.size(); }

private:
  // Ordered so that token_names() and listings are stable
  std::map<std::string, TokenSignature, std::less<>> signatures_;
};

/// Render a signature as "Name<T: Bound>(arg: Type, ...) -> Output"
[[nodiscard]] std::string to_string(const TokenSignature & signature);

}  // namespace rule_dsl

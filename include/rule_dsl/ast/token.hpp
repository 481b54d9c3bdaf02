// rule_dsl/ast/token.hpp - Raw token tree node
//
// A rule is authored as a tree of tagged tokens. Each token has a kind name
// (its "type" tag), named operand slots holding child tokens, and at most one
// inline integer literal (Number's `value`).
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

namespace rule_dsl
{

class Token;

/**
 * A named operand slot of a token.
 */
struct TokenArg
{
  std::string_view name;
  const Token * value = nullptr;
};

/**
 * Raw, untyped token.
 *
 * Tokens are created by TokenContext and are valid as long as the context
 * is alive. Kind and argument names are interned in the same context.
 */
class Token
{
public:
  Token(std::string_view type, gsl::span<TokenArg> args, std::optional<int32_t> literal)
  : type_(type), args_(args), literal_(literal)
  {
  }

  Token(const Token &) = delete;
  Token & operator=(const Token &) = delete;

  [[nodiscard]] std::string_view type() const noexcept { return type_; }

  [[nodiscard]] gsl::span<const TokenArg> args() const noexcept { return args_; }

  /// Inline integer literal (Number's `value`)
  [[nodiscard]] std::optional<int32_t> literal() const noexcept { return literal_; }

  [[nodiscard]] bool is(std::string_view type) const noexcept { return type_ == type; }

  /**
   * Find a child by argument name.
   *
   * @return The child token, or nullptr if the slot is absent
   */
  [[nodiscard]] const Token * arg(std::string_view name) const noexcept
  {
    for (const auto & a : args_) {
      if (a.name == name) {
        return a.value;
      }
    }
    return nullptr;
  }

  /**
   * Mutable access to the operand slots.
   *
   * Only used by builders that need to patch a child after creation.
   */
  [[nodiscard]] gsl::span<TokenArg> mutable_args() noexcept { return args_; }

private:
  std::string_view type_;
  gsl::span<TokenArg> args_;
  std::optional<int32_t> literal_;
};

/// Kind name of the list-element reference. It has no signature entry.
inline constexpr std::string_view k_element_token = "Element";

/// Name of the inline literal field in the JSON form.
inline constexpr std::string_view k_literal_field = "value";

}  // namespace rule_dsl

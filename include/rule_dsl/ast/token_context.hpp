// rule_dsl/ast/token_context.hpp - Token arena allocator and string pool
//
// Owns all tokens of a rule set and the interned kind/argument names.
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rule_dsl/ast/token.hpp"

namespace rule_dsl
{

/**
 * Context that owns tokens and interned strings.
 *
 * Tokens created through this context stay valid until the context is
 * destroyed. There is no individual deallocation.
 *
 * Example:
 * @code
 *   TokenContext ctx;
 *   const Token * me = ctx.create("ActingCharacter");
 *   const Token * strike = ctx.create("Strike", {{"target", me}});
 * @endcode
 */
class TokenContext
{
public:
  /// Default initial buffer size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit TokenContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~TokenContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  TokenContext(const TokenContext &) = delete;
  TokenContext & operator=(const TokenContext &) = delete;
  TokenContext(TokenContext &&) = delete;
  TokenContext & operator=(TokenContext &&) = delete;

  // ===========================================================================
  // Token Creation
  // ===========================================================================

  /**
   * Create a token.
   *
   * Kind and argument names are interned; the argument list is copied into
   * the arena.
   *
   * @param type Token kind name
   * @param args Named operand slots in authoring order
   * @param literal Inline integer literal, if any
   * @return Non-owning pointer to the created token
   */
  Token * create(
    std::string_view type, const std::vector<TokenArg> & args = {},
    std::optional<int32_t> literal = std::nullopt)
  {
    static_assert(
      std::is_trivially_destructible_v<Token>,
      "Token must be trivially destructible to be managed by the arena");

    const gsl::span<TokenArg> stored = allocate_args(args.size());
    for (size_t i = 0; i < args.size(); ++i) {
      stored[i] = TokenArg{intern(args[i].name), args[i].value};
    }

    void * const mem = arena_.allocate(sizeof(Token), alignof(Token));
    return new (mem) Token(intern(type), stored, literal);
  }

  /// Create a literal-only token such as `Number { value: 5 }`.
  Token * create_literal(std::string_view type, int32_t literal)
  {
    return create(type, {}, literal);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a stable string_view.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() + 1, 1));
    std::memcpy(ptr, s.data(), s.size());
    ptr[s.size()] = '\0';

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

private:
  gsl::span<TokenArg> allocate_args(size_t size)
  {
    if (size == 0) return {};
    auto * const ptr =
      static_cast<TokenArg *>(arena_.allocate(sizeof(TokenArg) * size, alignof(TokenArg)));
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<TokenArg>(ptr, size);
  }

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace rule_dsl

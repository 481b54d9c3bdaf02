// rule_dsl/sema/types/typed_ast.hpp - Token tree annotated with types
//
#pragma once

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/sema/types/type.hpp"

namespace rule_dsl
{

/**
 * A checked token with its resolved output type.
 *
 * Built bottom-up by TypeChecker, consumed top-down by the converters.
 * Children are stored in signature order, keyed by argument name.
 */
struct TypedAst
{
  const Token * token = nullptr;
  const Type * type = nullptr;
  std::vector<std::pair<std::string_view, std::unique_ptr<TypedAst>>> children;

  [[nodiscard]] std::string_view kind() const noexcept { return token->type(); }

  /**
   * Find a child by argument name.
   *
   * @return The child, or nullptr if absent
   */
  [[nodiscard]] const TypedAst * child(std::string_view name) const noexcept
  {
    for (const auto & [n, c] : children) {
      if (n == name) {
        return c.get();
      }
    }
    return nullptr;
  }
};

using TypedAstPtr = std::unique_ptr<TypedAst>;

}  // namespace rule_dsl

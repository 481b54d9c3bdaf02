// rule_dsl/codegen/typed_converter.hpp - Converter interface
//
// A TypedConverter<T> builds a Node<T> from one kind of typed token. There
// is one interface per concrete output type, so a converter never hands
// back a node that has to be downcast.
//
#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "rule_dsl/runtime/node.hpp"
#include "rule_dsl/sema/compile_error.hpp"
#include "rule_dsl/sema/types/typed_ast.hpp"

namespace rule_dsl
{

class ConverterRegistry;

/**
 * Node or CompileError.
 */
template <typename T>
struct ConvertResult
{
  NodePtr<T> node;
  std::optional<CompileError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static ConvertResult ok(NodePtr<T> node)
  {
    ConvertResult r;
    r.node = std::move(node);
    return r;
  }

  static ConvertResult fail(CompileError err)
  {
    ConvertResult r;
    r.error = std::move(err);
    return r;
  }

  /// Re-wrap a failure for another output type
  template <typename U>
  [[nodiscard]] ConvertResult<U> forward_error() &&
  {
    return ConvertResult<U>::fail(std::move(*error));
  }
};

template <typename T>
class TypedConverter
{
public:
  virtual ~TypedConverter() = default;

  /// Token kind this converter handles
  [[nodiscard]] virtual std::string_view token_type() const = 0;

  /**
   * Refine the match beyond the token kind (operand types, for example).
   */
  [[nodiscard]] virtual bool can_convert(const TypedAst & /*ast*/) const { return true; }

  /**
   * Build the node. Children are requested through the registry.
   */
  [[nodiscard]] virtual ConvertResult<T> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const = 0;
};

template <typename T>
using ConverterPtr = std::unique_ptr<const TypedConverter<T>>;

}  // namespace rule_dsl

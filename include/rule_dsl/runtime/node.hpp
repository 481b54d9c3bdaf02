// rule_dsl/runtime/node.hpp - Evaluation node interface
//
// A compiled rule is a tree of Node<T>, one interface per concrete output
// type. Evaluation returns either a value or a NodeError.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace rule_dsl
{

class EvaluationContext;

// ============================================================================
// NodeError
// ============================================================================

/**
 * Runtime failure of a node.
 *
 * - Evaluation: an impossibility in a well-typed tree (empty reduction,
 *   missing current element); propagated to the caller
 * - Break: "this rule does not apply"; the resolver moves to the next rule
 */
class NodeError
{
public:
  enum class Kind : uint8_t {
    Evaluation,
    Break,
  };

  static NodeError evaluation(std::string message)
  {
    return NodeError(Kind::Evaluation, std::move(message));
  }
  static NodeError brk() { return NodeError(Kind::Break, {}); }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_break() const noexcept { return kind_ == Kind::Break; }
  [[nodiscard]] const std::string & message() const noexcept { return message_; }

  /// "Evaluation error: <message>" or "Break"
  [[nodiscard]] std::string describe() const
  {
    return is_break() ? std::string("Break") : "Evaluation error: " + message_;
  }

private:
  NodeError(Kind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

  Kind kind_;
  std::string message_;
};

// ============================================================================
// NodeResult
// ============================================================================

/**
 * Value or NodeError.
 *
 * Implicitly constructible from either, so nodes can `return value;` or
 * `return NodeError::brk();`.
 */
template <typename T>
class NodeResult
{
public:
  NodeResult(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  NodeResult(NodeError error) : storage_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T & value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(storage_); }
  [[nodiscard]] T && value() && { return std::get<0>(std::move(storage_)); }

  [[nodiscard]] const NodeError & error() const { return std::get<1>(storage_); }
  [[nodiscard]] NodeError take_error() && { return std::get<1>(std::move(storage_)); }

private:
  std::variant<T, NodeError> storage_;
};

// ============================================================================
// Node<T>
// ============================================================================

template <typename T>
class Node
{
public:
  virtual ~Node() = default;

  /**
   * Evaluate against one context.
   *
   * Nodes are immutable; the only side effect allowed is drawing from the
   * context's random source.
   */
  [[nodiscard]] virtual NodeResult<T> evaluate(EvaluationContext & ctx) const = 0;
};

template <typename T>
using NodePtr = std::unique_ptr<const Node<T>>;

}  // namespace rule_dsl

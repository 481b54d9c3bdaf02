// rule_dsl/runtime/nodes/condition_nodes.hpp - Boolean-producing nodes
//
#pragma once

#include <functional>
#include <utility>

#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/runtime/evaluation_context.hpp"
#include "rule_dsl/runtime/node.hpp"

namespace rule_dsl
{

/**
 * Fair coin flip drawn from the context's random source.
 */
class TrueOrFalseRandomNode : public Node<bool>
{
public:
  NodeResult<bool> evaluate(EvaluationContext & ctx) const override;
};

/**
 * Compare two numeric operands after projecting each to i32 with to_i32().
 *
 * L and R are int32_t or CharacterHP; Cmp is std::greater<> or std::less<>.
 * The left operand is evaluated first.
 */
template <typename L, typename R, typename Cmp>
class NumericCompareNode : public Node<bool>
{
public:
  NumericCompareNode(NodePtr<L> left, NodePtr<R> right)
  : left_(std::move(left)), right_(std::move(right))
  {
  }

  NodeResult<bool> evaluate(EvaluationContext & ctx) const override
  {
    auto left = left_->evaluate(ctx);
    if (!left) {
      return std::move(left).take_error();
    }
    auto right = right_->evaluate(ctx);
    if (!right) {
      return std::move(right).take_error();
    }
    return Cmp{}(to_i32(left.value()), to_i32(right.value()));
  }

private:
  NodePtr<L> left_;
  NodePtr<R> right_;
};

template <typename L, typename R>
using GreaterThanNode = NumericCompareNode<L, R, std::greater<>>;

template <typename L, typename R>
using LessThanNode = NumericCompareNode<L, R, std::less<>>;

/**
 * Equality of two operands of the same type.
 *
 * Characters compare by id, CharacterHP by its HP value.
 */
template <typename T>
class EqConditionNode : public Node<bool>
{
public:
  EqConditionNode(NodePtr<T> left, NodePtr<T> right)
  : left_(std::move(left)), right_(std::move(right))
  {
  }

  NodeResult<bool> evaluate(EvaluationContext & ctx) const override
  {
    auto left = left_->evaluate(ctx);
    if (!left) {
      return std::move(left).take_error();
    }
    auto right = right_->evaluate(ctx);
    if (!right) {
      return std::move(right).take_error();
    }
    return left.value() == right.value();
  }

private:
  NodePtr<T> left_;
  NodePtr<T> right_;
};

}  // namespace rule_dsl

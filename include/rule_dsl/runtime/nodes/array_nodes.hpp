// rule_dsl/runtime/nodes/array_nodes.hpp - Collection nodes and combinators
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/runtime/evaluation_context.hpp"
#include "rule_dsl/runtime/node.hpp"

namespace rule_dsl
{

// ============================================================================
// Sources
// ============================================================================

class AllCharactersNode : public Node<std::vector<Character>>
{
public:
  NodeResult<std::vector<Character>> evaluate(EvaluationContext & ctx) const override;
};

class TeamMembersNode : public Node<std::vector<Character>>
{
public:
  explicit TeamMembersNode(NodePtr<TeamSide> team_side) : team_side_(std::move(team_side)) {}

  NodeResult<std::vector<Character>> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<TeamSide> team_side_;
};

class AllTeamSidesNode : public Node<std::vector<TeamSide>>
{
public:
  NodeResult<std::vector<TeamSide>> evaluate(EvaluationContext & ctx) const override;
};

// ============================================================================
// Combinators
// ============================================================================

/**
 * Keep the elements for which `condition` holds, in source order.
 *
 * The source is evaluated once; the condition is evaluated per element in
 * a context whose current element is that element.
 */
template <typename T>
class FilterListNode : public Node<std::vector<T>>
{
public:
  FilterListNode(NodePtr<std::vector<T>> array, NodePtr<bool> condition)
  : array_(std::move(array)), condition_(std::move(condition))
  {
  }

  NodeResult<std::vector<T>> evaluate(EvaluationContext & ctx) const override
  {
    auto items = array_->evaluate(ctx);
    if (!items) {
      return std::move(items).take_error();
    }

    std::vector<T> kept;
    for (auto & item : items.value()) {
      EvaluationContext scoped = ctx.with_element(item);
      auto keep = condition_->evaluate(scoped);
      if (!keep) {
        return std::move(keep).take_error();
      }
      if (keep.value()) {
        kept.push_back(std::move(item));
      }
    }
    return kept;
  }

private:
  NodePtr<std::vector<T>> array_;
  NodePtr<bool> condition_;
};

/**
 * Apply `transform` to every element, in source order.
 */
template <typename In, typename Out>
class MapNode : public Node<std::vector<Out>>
{
public:
  MapNode(NodePtr<std::vector<In>> array, NodePtr<Out> transform)
  : array_(std::move(array)), transform_(std::move(transform))
  {
  }

  NodeResult<std::vector<Out>> evaluate(EvaluationContext & ctx) const override
  {
    auto items = array_->evaluate(ctx);
    if (!items) {
      return std::move(items).take_error();
    }

    std::vector<Out> mapped;
    mapped.reserve(items.value().size());
    for (const auto & item : items.value()) {
      EvaluationContext scoped = ctx.with_element(item);
      auto out = transform_->evaluate(scoped);
      if (!out) {
        return std::move(out).take_error();
      }
      mapped.push_back(std::move(out).value());
    }
    return mapped;
  }

private:
  NodePtr<std::vector<In>> array_;
  NodePtr<Out> transform_;
};

/**
 * Uniformly random element.
 */
template <typename T>
class RandomPickNode : public Node<T>
{
public:
  explicit RandomPickNode(NodePtr<std::vector<T>> array) : array_(std::move(array)) {}

  NodeResult<T> evaluate(EvaluationContext & ctx) const override
  {
    auto items = array_->evaluate(ctx);
    if (!items) {
      return std::move(items).take_error();
    }
    if (items.value().empty()) {
      return NodeError::evaluation("Cannot pick from empty array");
    }

    std::uniform_int_distribution<size_t> pick(0, items.value().size() - 1);
    return std::move(items.value()[pick(ctx.rng())]);
  }

private:
  NodePtr<std::vector<T>> array_;
};

// ============================================================================
// Reductions
// ============================================================================

/// Ordering key of an element for Max/Min
inline int32_t order_key(int32_t v) noexcept { return v; }
inline int32_t order_key(const CharacterHP & v) noexcept { return v.hp_value; }
inline int32_t order_key(const Character & v) noexcept { return v.hp; }

/**
 * Largest (PickGreater) or smallest element by order_key().
 *
 * The first occurrence wins ties.
 */
template <typename T, bool PickGreater>
class ExtremumNode : public Node<T>
{
public:
  explicit ExtremumNode(NodePtr<std::vector<T>> array) : array_(std::move(array)) {}

  NodeResult<T> evaluate(EvaluationContext & ctx) const override
  {
    auto items = array_->evaluate(ctx);
    if (!items) {
      return std::move(items).take_error();
    }

    auto & values = items.value();
    if (values.empty()) {
      return NodeError::evaluation(
        std::string("Cannot find ") + (PickGreater ? "max" : "min") + " of empty array");
    }

    size_t best = 0;
    for (size_t i = 1; i < values.size(); ++i) {
      const int32_t key = order_key(values[i]);
      const int32_t best_key = order_key(values[best]);
      if (PickGreater ? key > best_key : key < best_key) {
        best = i;
      }
    }
    return std::move(values[best]);
  }

private:
  NodePtr<std::vector<T>> array_;
};

template <typename T>
using MaxNode = ExtremumNode<T, true>;

template <typename T>
using MinNode = ExtremumNode<T, false>;

}  // namespace rule_dsl

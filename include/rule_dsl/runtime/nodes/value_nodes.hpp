// rule_dsl/runtime/nodes/value_nodes.hpp - Scalar value nodes
//
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/runtime/evaluation_context.hpp"
#include "rule_dsl/runtime/node.hpp"

namespace rule_dsl
{

/**
 * A constant value (Number, Enemy, Hero).
 */
template <typename T>
class ConstantNode : public Node<T>
{
public:
  explicit ConstantNode(T value) : value_(std::move(value)) {}

  NodeResult<T> evaluate(EvaluationContext &) const override { return value_; }

private:
  T value_;
};

using NumberNode = ConstantNode<int32_t>;
using TeamSideNode = ConstantNode<TeamSide>;

class ActingCharacterNode : public Node<Character>
{
public:
  NodeResult<Character> evaluate(EvaluationContext & ctx) const override;
};

class CharacterToHpNode : public Node<CharacterHP>
{
public:
  explicit CharacterToHpNode(NodePtr<Character> character) : character_(std::move(character)) {}

  NodeResult<CharacterHP> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<Character> character_;
};

class CharacterHpToCharacterNode : public Node<Character>
{
public:
  explicit CharacterHpToCharacterNode(NodePtr<CharacterHP> character_hp)
  : character_hp_(std::move(character_hp))
  {
  }

  NodeResult<Character> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<CharacterHP> character_hp_;
};

/**
 * Side of a character: the player team is searched first, then the enemy
 * team.
 */
class CharacterTeamNode : public Node<TeamSide>
{
public:
  explicit CharacterTeamNode(NodePtr<Character> character) : character_(std::move(character)) {}

  NodeResult<TeamSide> evaluate(EvaluationContext & ctx) const override;

private:
  NodePtr<Character> character_;
};

/**
 * The current element bound by the enclosing FilterList or Map, narrowed
 * to T.
 */
template <typename T>
class ElementNode : public Node<T>
{
public:
  NodeResult<T> evaluate(EvaluationContext & ctx) const override
  {
    const auto & element = ctx.current_element();
    if (!element) {
      return NodeError::evaluation("No current element in context");
    }
    if (const T * value = std::get_if<T>(&*element)) {
      return *value;
    }
    return NodeError::evaluation(std::string("Current element is not a ") + ElementName<T>::value);
  }
};

}  // namespace rule_dsl

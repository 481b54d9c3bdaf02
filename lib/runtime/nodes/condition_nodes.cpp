// rule_dsl/runtime/nodes/condition_nodes.cpp - Boolean-producing nodes
//
#include "rule_dsl/runtime/nodes/condition_nodes.hpp"

namespace rule_dsl
{

NodeResult<bool> TrueOrFalseRandomNode::evaluate(EvaluationContext & ctx) const
{
  std::bernoulli_distribution coin(0.5);
  return coin(ctx.rng());
}

}  // namespace rule_dsl

// rule_dsl/codegen/action_converters.cpp - Strike, Heal and Check
//
#include "rule_dsl/codegen/converter_registry.hpp"
#include "rule_dsl/runtime/nodes/action_nodes.hpp"

namespace rule_dsl
{

namespace
{

/// Strike and Heal share the shape `Kind { target: Character }`
template <typename NodeT>
class TargetedActionConverter : public TypedConverter<ActionPtr>
{
public:
  explicit TargetedActionConverter(std::string_view kind) : kind_(kind) {}

  std::string_view token_type() const override { return kind_; }

  ConvertResult<ActionPtr> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto target = registry.convert_child<Character>(ast, "target");
    if (!target.success()) {
      return std::move(target).forward_error<ActionPtr>();
    }
    return ConvertResult<ActionPtr>::ok(std::make_unique<NodeT>(std::move(target.node)));
  }

private:
  std::string_view kind_;
};

class CheckConverter : public TypedConverter<ActionPtr>
{
public:
  std::string_view token_type() const override { return "Check"; }

  ConvertResult<ActionPtr> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto condition = registry.convert_child<bool>(ast, "condition");
    if (!condition.success()) {
      return std::move(condition).forward_error<ActionPtr>();
    }
    auto then_action = registry.convert_child<ActionPtr>(ast, "then_action");
    if (!then_action.success()) {
      return then_action;
    }
    return ConvertResult<ActionPtr>::ok(
      std::make_unique<CheckNode>(std::move(condition.node), std::move(then_action.node)));
  }
};

}  // namespace

void register_action_converters(ConverterRegistry & registry)
{
  registry.add<ActionPtr>(std::make_unique<TargetedActionConverter<StrikeNode>>("Strike"));
  registry.add<ActionPtr>(std::make_unique<TargetedActionConverter<HealNode>>("Heal"));
  registry.add<ActionPtr>(std::make_unique<CheckConverter>());
}

}  // namespace rule_dsl

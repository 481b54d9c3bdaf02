// rule_dsl/codegen/condition_converters.cpp - Boolean-producing tokens
//
#include "rule_dsl/codegen/converter_registry.hpp"
#include "rule_dsl/runtime/nodes/condition_nodes.hpp"

namespace rule_dsl
{

namespace
{

class TrueOrFalseRandomConverter : public TypedConverter<bool>
{
public:
  std::string_view token_type() const override { return "TrueOrFalseRandom"; }

  ConvertResult<bool> convert(const TypedAst &, const ConverterRegistry &) const override
  {
    return ConvertResult<bool>::ok(std::make_unique<TrueOrFalseRandomNode>());
  }
};

/**
 * GreaterThan/LessThan for one (L, R) representation pair.
 *
 * Selected when numeric_operand_kind() resolves the operands to L and R.
 */
template <typename L, typename R, typename Cmp>
class NumericCompareConverter : public TypedConverter<bool>
{
public:
  explicit NumericCompareConverter(std::string_view kind) : kind_(kind) {}

  std::string_view token_type() const override { return kind_; }

  bool can_convert(const TypedAst & ast) const override
  {
    const TypedAst * left = ast.child("left");
    const TypedAst * right = ast.child("right");
    return numeric_operand_kind(left, right) == ValueType<L>::kind &&
           numeric_operand_kind(right, left) == ValueType<R>::kind;
  }

  ConvertResult<bool> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto left = registry.convert_child<L>(ast, "left");
    if (!left.success()) {
      return std::move(left).template forward_error<bool>();
    }
    auto right = registry.convert_child<R>(ast, "right");
    if (!right.success()) {
      return std::move(right).template forward_error<bool>();
    }
    return ConvertResult<bool>::ok(
      std::make_unique<NumericCompareNode<L, R, Cmp>>(std::move(left.node), std::move(right.node)));
  }

private:
  std::string_view kind_;
};

/**
 * Eq over one operand type, selected by the left operand's checked type.
 */
template <typename T>
class EqConverter : public TypedConverter<bool>
{
public:
  std::string_view token_type() const override { return "Eq"; }

  bool can_convert(const TypedAst & ast) const override
  {
    const TypedAst * left = ast.child("left");
    const TypedAst * right = ast.child("right");
    if (left == nullptr) {
      return false;
    }
    if (left->type->kind == TypeKind::Numeric) {
      return numeric_operand_kind(left, right) == ValueType<T>::kind;
    }
    return left->type->kind == ValueType<T>::kind;
  }

  ConvertResult<bool> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto left = registry.convert_child<T>(ast, "left");
    if (!left.success()) {
      return std::move(left).template forward_error<bool>();
    }
    auto right = registry.convert_child<T>(ast, "right");
    if (!right.success()) {
      return std::move(right).template forward_error<bool>();
    }
    return ConvertResult<bool>::ok(
      std::make_unique<EqConditionNode<T>>(std::move(left.node), std::move(right.node)));
  }
};

template <typename Cmp>
void register_comparison(ConverterRegistry & registry, std::string_view kind)
{
  registry.add<bool>(std::make_unique<NumericCompareConverter<int32_t, int32_t, Cmp>>(kind));
  registry.add<bool>(std::make_unique<NumericCompareConverter<CharacterHP, int32_t, Cmp>>(kind));
  registry.add<bool>(std::make_unique<NumericCompareConverter<int32_t, CharacterHP, Cmp>>(kind));
  registry.add<bool>(
    std::make_unique<NumericCompareConverter<CharacterHP, CharacterHP, Cmp>>(kind));
}

}  // namespace

void register_condition_converters(ConverterRegistry & registry)
{
  registry.add<bool>(std::make_unique<TrueOrFalseRandomConverter>());

  register_comparison<std::greater<>>(registry, "GreaterThan");
  register_comparison<std::less<>>(registry, "LessThan");

  registry.add<bool>(std::make_unique<EqConverter<int32_t>>());
  registry.add<bool>(std::make_unique<EqConverter<bool>>());
  registry.add<bool>(std::make_unique<EqConverter<Character>>());
  registry.add<bool>(std::make_unique<EqConverter<CharacterHP>>());
  registry.add<bool>(std::make_unique<EqConverter<TeamSide>>());
}

}  // namespace rule_dsl

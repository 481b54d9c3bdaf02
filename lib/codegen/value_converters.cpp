// rule_dsl/codegen/value_converters.cpp - Scalar value tokens
//
#include "rule_dsl/codegen/converter_registry.hpp"
#include "rule_dsl/runtime/nodes/value_nodes.hpp"

namespace rule_dsl
{

namespace
{

class NumberConverter : public TypedConverter<int32_t>
{
public:
  std::string_view token_type() const override { return "Number"; }

  bool can_convert(const TypedAst & ast) const override { return ast.token->literal().has_value(); }

  ConvertResult<int32_t> convert(const TypedAst & ast, const ConverterRegistry &) const override
  {
    return ConvertResult<int32_t>::ok(std::make_unique<NumberNode>(*ast.token->literal()));
  }
};

class ActingCharacterConverter : public TypedConverter<Character>
{
public:
  std::string_view token_type() const override { return "ActingCharacter"; }

  ConvertResult<Character> convert(const TypedAst &, const ConverterRegistry &) const override
  {
    return ConvertResult<Character>::ok(std::make_unique<ActingCharacterNode>());
  }
};

class CharacterToHpConverter : public TypedConverter<CharacterHP>
{
public:
  std::string_view token_type() const override { return "CharacterToHp"; }

  ConvertResult<CharacterHP> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto character = registry.convert_child<Character>(ast, "character");
    if (!character.success()) {
      return std::move(character).forward_error<CharacterHP>();
    }
    return ConvertResult<CharacterHP>::ok(
      std::make_unique<CharacterToHpNode>(std::move(character.node)));
  }
};

class CharacterHpToCharacterConverter : public TypedConverter<Character>
{
public:
  std::string_view token_type() const override { return "CharacterHpToCharacter"; }

  ConvertResult<Character> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto hp = registry.convert_child<CharacterHP>(ast, "character_hp");
    if (!hp.success()) {
      return std::move(hp).forward_error<Character>();
    }
    return ConvertResult<Character>::ok(
      std::make_unique<CharacterHpToCharacterNode>(std::move(hp.node)));
  }
};

class CharacterTeamConverter : public TypedConverter<TeamSide>
{
public:
  std::string_view token_type() const override { return "CharacterTeam"; }

  ConvertResult<TeamSide> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto character = registry.convert_child<Character>(ast, "character");
    if (!character.success()) {
      return std::move(character).forward_error<TeamSide>();
    }
    return ConvertResult<TeamSide>::ok(
      std::make_unique<CharacterTeamNode>(std::move(character.node)));
  }
};

class TeamSideConverter : public TypedConverter<TeamSide>
{
public:
  TeamSideConverter(std::string_view kind, TeamSide side) : kind_(kind), side_(side) {}

  std::string_view token_type() const override { return kind_; }

  ConvertResult<TeamSide> convert(const TypedAst &, const ConverterRegistry &) const override
  {
    return ConvertResult<TeamSide>::ok(std::make_unique<TeamSideNode>(side_));
  }

private:
  std::string_view kind_;
  TeamSide side_;
};

template <typename T>
class ElementConverter : public TypedConverter<T>
{
public:
  std::string_view token_type() const override { return k_element_token; }

  ConvertResult<T> convert(const TypedAst &, const ConverterRegistry &) const override
  {
    return ConvertResult<T>::ok(std::make_unique<ElementNode<T>>());
  }
};

}  // namespace

void register_value_converters(ConverterRegistry & registry)
{
  registry.add<int32_t>(std::make_unique<NumberConverter>());
  registry.add<Character>(std::make_unique<ActingCharacterConverter>());
  registry.add<CharacterHP>(std::make_unique<CharacterToHpConverter>());
  registry.add<Character>(std::make_unique<CharacterHpToCharacterConverter>());
  registry.add<TeamSide>(std::make_unique<CharacterTeamConverter>());
  registry.add<TeamSide>(std::make_unique<TeamSideConverter>("Enemy", TeamSide::Enemy));
  registry.add<TeamSide>(std::make_unique<TeamSideConverter>("Hero", TeamSide::Player));

  registry.add<Character>(std::make_unique<ElementConverter<Character>>());
  registry.add<int32_t>(std::make_unique<ElementConverter<int32_t>>());
  registry.add<TeamSide>(std::make_unique<ElementConverter<TeamSide>>());
  registry.add<CharacterHP>(std::make_unique<ElementConverter<CharacterHP>>());
}

}  // namespace rule_dsl

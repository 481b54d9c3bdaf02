// rule_dsl/codegen/array_converters.cpp - Collection tokens and combinators
//
#include <fmt/core.h>

#include "rule_dsl/codegen/converter_registry.hpp"
#include "rule_dsl/runtime/nodes/array_nodes.hpp"

namespace rule_dsl
{

namespace
{

// ============================================================================
// Sources
// ============================================================================

class AllCharactersConverter : public TypedConverter<std::vector<Character>>
{
public:
  std::string_view token_type() const override { return "AllCharacters"; }

  ConvertResult<std::vector<Character>> convert(
    const TypedAst &, const ConverterRegistry &) const override
  {
    return ConvertResult<std::vector<Character>>::ok(std::make_unique<AllCharactersNode>());
  }
};

class TeamMembersConverter : public TypedConverter<std::vector<Character>>
{
public:
  std::string_view token_type() const override { return "TeamMembers"; }

  ConvertResult<std::vector<Character>> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto side = registry.convert_child<TeamSide>(ast, "team_side");
    if (!side.success()) {
      return std::move(side).forward_error<std::vector<Character>>();
    }
    return ConvertResult<std::vector<Character>>::ok(
      std::make_unique<TeamMembersNode>(std::move(side.node)));
  }
};

class AllTeamSidesConverter : public TypedConverter<std::vector<TeamSide>>
{
public:
  std::string_view token_type() const override { return "AllTeamSides"; }

  ConvertResult<std::vector<TeamSide>> convert(
    const TypedAst &, const ConverterRegistry &) const override
  {
    return ConvertResult<std::vector<TeamSide>>::ok(std::make_unique<AllTeamSidesNode>());
  }
};

// ============================================================================
// Combinators
// ============================================================================

template <typename T>
class FilterListConverter : public TypedConverter<std::vector<T>>
{
public:
  std::string_view token_type() const override { return "FilterList"; }

  ConvertResult<std::vector<T>> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto array = registry.convert_child<std::vector<T>>(ast, "array");
    if (!array.success()) {
      return array;
    }
    auto condition = registry.convert_child<bool>(ast, "condition");
    if (!condition.success()) {
      return std::move(condition).template forward_error<std::vector<T>>();
    }
    return ConvertResult<std::vector<T>>::ok(
      std::make_unique<FilterListNode<T>>(std::move(array.node), std::move(condition.node)));
  }
};

/**
 * Map producing Vec<Out>; the input element type is read from the checked
 * type of the `array` child.
 */
template <typename Out>
class MapConverter : public TypedConverter<std::vector<Out>>
{
public:
  std::string_view token_type() const override { return "Map"; }

  ConvertResult<std::vector<Out>> convert(
    const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    const TypedAst * array = ast.child("array");
    const TypeKind in_kind = array != nullptr ? element_type_of(array->type)->kind : TypeKind::Void;

    switch (in_kind) {
      case TypeKind::Character:
        return build<Character>(ast, registry);
      case TypeKind::I32:
      case TypeKind::Numeric:
        return build<int32_t>(ast, registry);
      case TypeKind::CharacterHP:
        return build<CharacterHP>(ast, registry);
      case TypeKind::TeamSide:
        return build<TeamSide>(ast, registry);
      default:
        break;
    }

    // Missing or unsupported source: let convert_child report it.
    auto source = registry.convert_child<std::vector<Character>>(ast, "array");
    if (!source.success()) {
      return std::move(source).template forward_error<std::vector<Out>>();
    }
    CompileError err = CompileError::no_converter(
      ast.kind(), fmt::format("Vec<{}>", to_string(ValueType<Out>::get(registry.types()))));
    err.with_token(ast.token);
    return ConvertResult<std::vector<Out>>::fail(std::move(err));
  }

private:
  template <typename In>
  static ConvertResult<std::vector<Out>> build(
    const TypedAst & ast, const ConverterRegistry & registry)
  {
    auto array = registry.convert_child<std::vector<In>>(ast, "array");
    if (!array.success()) {
      return std::move(array).template forward_error<std::vector<Out>>();
    }
    auto transform = registry.convert_child<Out>(ast, "transform");
    if (!transform.success()) {
      return std::move(transform).template forward_error<std::vector<Out>>();
    }
    return ConvertResult<std::vector<Out>>::ok(
      std::make_unique<MapNode<In, Out>>(std::move(array.node), std::move(transform.node)));
  }
};

template <typename T>
class RandomPickConverter : public TypedConverter<T>
{
public:
  std::string_view token_type() const override { return "RandomPick"; }

  ConvertResult<T> convert(const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto array = registry.convert_child<std::vector<T>>(ast, "array");
    if (!array.success()) {
      return std::move(array).template forward_error<T>();
    }
    return ConvertResult<T>::ok(std::make_unique<RandomPickNode<T>>(std::move(array.node)));
  }
};

// ============================================================================
// Reductions
// ============================================================================

/**
 * Max/Min (and their Numeric-bounded variants) over Vec<T>.
 */
template <typename T, bool PickGreater>
class ExtremumConverter : public TypedConverter<T>
{
public:
  explicit ExtremumConverter(std::string_view kind) : kind_(kind) {}

  std::string_view token_type() const override { return kind_; }

  ConvertResult<T> convert(const TypedAst & ast, const ConverterRegistry & registry) const override
  {
    auto array = registry.convert_child<std::vector<T>>(ast, "array");
    if (!array.success()) {
      return std::move(array).template forward_error<T>();
    }
    return ConvertResult<T>::ok(
      std::make_unique<ExtremumNode<T, PickGreater>>(std::move(array.node)));
  }

private:
  std::string_view kind_;
};

template <typename T>
void register_element_family(ConverterRegistry & registry)
{
  registry.add<std::vector<T>>(std::make_unique<FilterListConverter<T>>());
  registry.add<std::vector<T>>(std::make_unique<MapConverter<T>>());
  registry.add<T>(std::make_unique<RandomPickConverter<T>>());
}

template <typename T>
void register_ordered(ConverterRegistry & registry, std::string_view max, std::string_view min)
{
  registry.add<T>(std::make_unique<ExtremumConverter<T, true>>(max));
  registry.add<T>(std::make_unique<ExtremumConverter<T, false>>(min));
}

}  // namespace

void register_array_converters(ConverterRegistry & registry)
{
  registry.add<std::vector<Character>>(std::make_unique<AllCharactersConverter>());
  registry.add<std::vector<Character>>(std::make_unique<TeamMembersConverter>());
  registry.add<std::vector<TeamSide>>(std::make_unique<AllTeamSidesConverter>());

  register_element_family<Character>(registry);
  register_element_family<int32_t>(registry);
  register_element_family<CharacterHP>(registry);
  register_element_family<TeamSide>(registry);

  register_ordered<int32_t>(registry, "Max", "Min");
  register_ordered<CharacterHP>(registry, "Max", "Min");
  register_ordered<Character>(registry, "Max", "Min");

  register_ordered<int32_t>(registry, "NumericMax", "NumericMin");
  register_ordered<CharacterHP>(registry, "NumericMax", "NumericMin");
}

}  // namespace rule_dsl

// rule_dsl/codegen/converter_registry.hpp - Converter tables per output type
//
// The registry keeps one table per concrete output type, each keyed by
// token kind. convert<T>() first checks that the node's checked type
// agrees with T, then asks the kind's converters in registration order.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "rule_dsl/codegen/typed_converter.hpp"
#include "rule_dsl/runtime/action.hpp"
#include "rule_dsl/runtime/battle.hpp"
#include "rule_dsl/sema/types/type.hpp"
#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

// ============================================================================
// Output Type Mapping
// ============================================================================

/**
 * Checked type corresponding to a runtime value type.
 */
template <typename T>
struct ValueType;

template <>
struct ValueType<ActionPtr>
{
  static constexpr TypeKind kind = TypeKind::Action;
  static const Type * get(TypeContext & t) { return t.action_type(); }
};

template <>
struct ValueType<bool>
{
  static constexpr TypeKind kind = TypeKind::Bool;
  static const Type * get(TypeContext & t) { return t.bool_type(); }
};

template <>
struct ValueType<int32_t>
{
  static constexpr TypeKind kind = TypeKind::I32;
  static const Type * get(TypeContext & t) { return t.i32_type(); }
};

template <>
struct ValueType<Character>
{
  static constexpr TypeKind kind = TypeKind::Character;
  static const Type * get(TypeContext & t) { return t.character_type(); }
};

template <>
struct ValueType<CharacterHP>
{
  static constexpr TypeKind kind = TypeKind::CharacterHP;
  static const Type * get(TypeContext & t) { return t.character_hp_type(); }
};

template <>
struct ValueType<TeamSide>
{
  static constexpr TypeKind kind = TypeKind::TeamSide;
  static const Type * get(TypeContext & t) { return t.team_side_type(); }
};

template <typename E>
struct ValueType<std::vector<E>>
{
  static constexpr TypeKind kind = TypeKind::Vec;
  static const Type * get(TypeContext & t) { return t.get_vec_type(ValueType<E>::get(t)); }
};

// ============================================================================
// Converter Table
// ============================================================================

template <typename T>
class ConverterTable
{
public:
  void add(ConverterPtr<T> converter)
  {
    const std::string kind(converter->token_type());
    by_kind_[kind].push_back(std::move(converter));
  }

  /// Converters for a kind, in registration order (nullptr if none)
  [[nodiscard]] const std::vector<ConverterPtr<T>> * find(std::string_view kind) const
  {
    auto it = by_kind_.find(std::string(kind));
    return it != by_kind_.end() ? &it->second : nullptr;
  }

  [[nodiscard]] size_t size() const noexcept
  {
    size_t n = 0;
    for (const auto & [kind, list] : by_kind_) {
      n += list.size();
    }
    return n;
  }

private:
  std::unordered_map<std::string, std::vector<ConverterPtr<T>>> by_kind_;
};

// ============================================================================
// Converter Registry
// ============================================================================

class ConverterRegistry
{
public:
  explicit ConverterRegistry(TypeContext & types) : types_(types) {}

  ConverterRegistry(const ConverterRegistry &) = delete;
  ConverterRegistry & operator=(const ConverterRegistry &) = delete;

  template <typename T>
  void add(ConverterPtr<T> converter)
  {
    table<T>().add(std::move(converter));
  }

  /**
   * Convert a typed node to Node<T>.
   *
   * @return ChildTypeMismatch if the node's checked type disagrees with T,
   *         NoConverter if no registered converter accepts the node
   */
  template <typename T>
  [[nodiscard]] ConvertResult<T> convert(const TypedAst & ast) const
  {
    const Type * requested = ValueType<T>::get(types_);
    if (!accepts(requested, ast.type)) {
      CompileError err =
        CompileError::child_type_mismatch(ast.kind(), to_string(requested), to_string(ast.type));
      err.with_token(ast.token);
      return ConvertResult<T>::fail(std::move(err));
    }

    if (const auto * list = table<T>().find(ast.kind())) {
      for (const auto & converter : *list) {
        if (converter->can_convert(ast)) {
          return converter->convert(ast, *this);
        }
      }
    }

    CompileError err = CompileError::no_converter(ast.kind(), to_string(requested));
    err.with_token(ast.token);
    return ConvertResult<T>::fail(std::move(err));
  }

  /**
   * Convert the child `name` of `parent` to Node<T>.
   *
   * Errors get the (parent kind, name) segment prepended to their path.
   */
  template <typename T>
  [[nodiscard]] ConvertResult<T> convert_child(const TypedAst & parent, std::string_view name) const
  {
    const PathSegment segment{std::string(parent.kind()), std::string(name)};

    const TypedAst * child = parent.child(name);
    if (child == nullptr) {
      CompileError err = CompileError::missing_child(parent.kind(), name);
      err.with_token(parent.token).prepend_path(segment);
      return ConvertResult<T>::fail(std::move(err));
    }

    ConvertResult<T> result = convert<T>(*child);
    if (!result.success()) {
      result.error->prepend_path(segment);
    }
    return result;
  }

  [[nodiscard]] TypeContext & types() const noexcept { return types_; }

  /// Number of registered converters over all tables
  [[nodiscard]] size_t size() const noexcept;

private:
  /// Checked type `actual` may be built as `requested`
  [[nodiscard]] static bool accepts(const Type * requested, const Type * actual);

  using Tables = std::tuple<
    ConverterTable<ActionPtr>, ConverterTable<bool>, ConverterTable<int32_t>,
    ConverterTable<Character>, ConverterTable<CharacterHP>, ConverterTable<TeamSide>,
    ConverterTable<std::vector<Character>>, ConverterTable<std::vector<int32_t>>,
    ConverterTable<std::vector<CharacterHP>>, ConverterTable<std::vector<TeamSide>>>;

  template <typename T>
  [[nodiscard]] ConverterTable<T> & table() noexcept
  {
    return std::get<ConverterTable<T>>(tables_);
  }

  template <typename T>
  [[nodiscard]] const ConverterTable<T> & table() const noexcept
  {
    return std::get<ConverterTable<T>>(tables_);
  }

  TypeContext & types_;
  Tables tables_;
};

// ============================================================================
// Numeric Operand Resolution
// ============================================================================

/**
 * Concrete representation of a Numeric operand: TypeKind::I32 or
 * TypeKind::CharacterHP.
 *
 * Preference order: the operand's own concrete type, the sibling operand's
 * concrete type, the element type of a NumericMax/NumericMin array, and
 * finally i32.
 *
 * @param operand The operand to resolve
 * @param sibling The other operand of the same comparison (may be nullptr)
 */
[[nodiscard]] TypeKind numeric_operand_kind(const TypedAst * operand, const TypedAst * sibling);

/**
 * Register every builtin converter.
 */
void register_builtin_converters(ConverterRegistry & registry);

// Per-family registration, called by register_builtin_converters
void register_action_converters(ConverterRegistry & registry);
void register_condition_converters(ConverterRegistry & registry);
void register_value_converters(ConverterRegistry & registry);
void register_array_converters(ConverterRegistry & registry);

}  // namespace rule_dsl

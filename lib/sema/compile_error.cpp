// rule_dsl/sema/compile_error.cpp - Compile-time error values
//
#include "rule_dsl/sema/compile_error.hpp"

#include <fmt/core.h>

#include <utility>

#include "rule_dsl/ast/token_dumper.hpp"
#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

// ============================================================================
// Factories
// ============================================================================

CompileError CompileError::type_mismatch(const Type * expected, const Type * actual)
{
  CompileError e(CompileErrorKind::TypeMismatch);
  e.expected_ = to_string(expected);
  e.actual_ = to_string(actual);
  return e;
}

CompileError CompileError::undefined_token(std::string_view token_type)
{
  CompileError e(CompileErrorKind::UndefinedToken);
  e.subject_ = std::string(token_type);
  return e;
}

CompileError CompileError::missing_field(std::string_view token_type, std::string_view field)
{
  CompileError e(CompileErrorKind::MissingField);
  e.subject_ = std::string(token_type);
  e.detail_ = std::string(field);
  return e;
}

CompileError CompileError::unresolved_type(std::string context)
{
  CompileError e(CompileErrorKind::UnresolvedType);
  e.detail_ = std::move(context);
  return e;
}

CompileError CompileError::infinite_type(const Type * var, const Type * type)
{
  CompileError e(CompileErrorKind::InfiniteType);
  e.expected_ = to_string(var);
  e.actual_ = to_string(type);
  return e;
}

CompileError CompileError::cyclic_reference(std::string_view token_type, std::string cycle)
{
  CompileError e(CompileErrorKind::CyclicReference);
  e.subject_ = std::string(token_type);
  e.detail_ = std::move(cycle);
  return e;
}

CompileError CompileError::trait_bound(
  const Type * type, std::string_view trait_name, std::vector<std::string> available_traits)
{
  CompileError e(CompileErrorKind::TraitBoundError);
  e.actual_ = to_string(type);
  e.subject_ = std::string(trait_name);
  e.available_traits_ = std::move(available_traits);
  return e;
}

CompileError CompileError::argument_count(
  std::string_view token_type, size_t expected, size_t actual)
{
  CompileError e(CompileErrorKind::ArgumentCountMismatch);
  e.subject_ = std::string(token_type);
  e.expected_ = std::to_string(expected);
  e.actual_ = std::to_string(actual);
  return e;
}

CompileError CompileError::no_converter(std::string_view token_type, std::string target_type)
{
  CompileError e(CompileErrorKind::NoConverter);
  e.subject_ = std::string(token_type);
  e.expected_ = std::move(target_type);
  return e;
}

CompileError CompileError::missing_child(std::string_view token_type, std::string_view child)
{
  CompileError e(CompileErrorKind::MissingChild);
  e.subject_ = std::string(token_type);
  e.detail_ = std::string(child);
  return e;
}

CompileError CompileError::child_type_mismatch(
  std::string_view token_type, std::string expected, std::string actual)
{
  CompileError e(CompileErrorKind::ChildTypeMismatch);
  e.subject_ = std::string(token_type);
  e.expected_ = std::move(expected);
  e.actual_ = std::move(actual);
  return e;
}

// ============================================================================
// Context
// ============================================================================

CompileError & CompileError::with_token(const Token * token)
{
  if (token_ == nullptr) {
    token_ = token;
  }
  return *this;
}

CompileError & CompileError::with_path(std::vector<PathSegment> path)
{
  path_ = std::move(path);
  return *this;
}

CompileError & CompileError::prepend_path(PathSegment segment)
{
  path_.insert(path_.begin(), std::move(segment));
  return *this;
}

// ============================================================================
// Rendering
// ============================================================================

std::string CompileError::location() const
{
  std::string out;
  for (size_t i = 0; i < path_.size(); ++i) {
    if (i > 0) out += " -> ";
    out += path_[i].to_string();
  }
  return out;
}

std::string CompileError::context() const
{
  if (path_.empty()) {
    return "rule root";
  }
  return path_.back().to_string();
}

std::string CompileError::message() const
{
  switch (kind_) {
    case CompileErrorKind::TypeMismatch:
      return fmt::format(
        "Type mismatch in {}: expected {}, but got {}", context(), expected_, actual_);
    case CompileErrorKind::UndefinedToken:
      return fmt::format("Undefined token type: {}", subject_);
    case CompileErrorKind::MissingField:
      return fmt::format("Token '{}' is missing required field '{}'", subject_, detail_);
    case CompileErrorKind::UnresolvedType:
      return fmt::format("Cannot resolve type in context: {}", detail_);
    case CompileErrorKind::InfiniteType:
      return fmt::format("Infinite type: {} occurs in {}", expected_, actual_);
    case CompileErrorKind::CyclicReference:
      return fmt::format("Cyclic reference detected in token '{}': {}", subject_, detail_);
    case CompileErrorKind::TraitBoundError:
      return fmt::format("Type {} does not implement trait {}", actual_, subject_);
    case CompileErrorKind::ArgumentCountMismatch:
      return fmt::format(
        "Token '{}' expects {} arguments, but got {}", subject_, expected_, actual_);
    case CompileErrorKind::NoConverter:
      return fmt::format("No converter found for token '{}' producing {}", subject_, expected_);
    case CompileErrorKind::MissingChild:
      return fmt::format("Child '{}' of token '{}' not found in typed AST", detail_, subject_);
    case CompileErrorKind::ChildTypeMismatch:
      return fmt::format(
        "Token '{}' was requested as {}, but its checked type is {}", subject_, expected_,
        actual_);
  }
  return "unknown compile error";
}

const char * CompileError::code() const noexcept
{
  switch (kind_) {
    case CompileErrorKind::TypeMismatch:
      return "E001";
    case CompileErrorKind::UndefinedToken:
      return "E002";
    case CompileErrorKind::MissingField:
      return "E003";
    case CompileErrorKind::UnresolvedType:
      return "E004";
    case CompileErrorKind::InfiniteType:
      return "E005";
    case CompileErrorKind::CyclicReference:
      return "E006";
    case CompileErrorKind::TraitBoundError:
      return "E007";
    case CompileErrorKind::ArgumentCountMismatch:
      return "E008";
    case CompileErrorKind::NoConverter:
      return "E009";
    case CompileErrorKind::MissingChild:
      return "E010";
    case CompileErrorKind::ChildTypeMismatch:
      return "E011";
  }
  return "E000";
}

std::string CompileError::suggestion() const
{
  switch (kind_) {
    case CompileErrorKind::TypeMismatch:
      return fmt::format(
        "Provide a token producing {} here, or wrap the value in a conversion token", expected_);
    case CompileErrorKind::UndefinedToken:
      return fmt::format("Check the spelling of '{}'", subject_);
    case CompileErrorKind::MissingField:
      return fmt::format("Add the '{}' field to the '{}' token", detail_, subject_);
    case CompileErrorKind::UnresolvedType:
      return "Element can only be used inside the condition of FilterList or the transform of "
             "Map";
    case CompileErrorKind::InfiniteType:
      return "A value cannot contain itself; check nested Vec operands";
    case CompileErrorKind::CyclicReference:
      return "Token trees must be acyclic; build a fresh token for each use";
    case CompileErrorKind::TraitBoundError: {
      if (available_traits_.empty()) {
        return fmt::format("{} implements no traits", actual_);
      }
      std::string list;
      for (const auto & t : available_traits_) {
        if (!list.empty()) list += ", ";
        list += t;
      }
      return fmt::format("{} implements: {}", actual_, list);
    }
    case CompileErrorKind::ArgumentCountMismatch:
      return fmt::format("Remove the extra operands of '{}'", subject_);
    case CompileErrorKind::NoConverter:
      return fmt::format("'{}' cannot be used where {} is required", subject_, expected_);
    case CompileErrorKind::MissingChild:
    case CompileErrorKind::ChildTypeMismatch:
      return "The typed tree does not match the checked rule; recompile from the token tree";
  }
  return {};
}

Diagnostic CompileError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = code();
  d.message = message();
  d.labels.push_back(Label{location(), std::string(to_string(kind_)), LabelStyle::Primary});
  d.help_message = suggestion();
  if (token_ != nullptr) {
    d.snippet = dump_token(token_);
  }
  return d;
}

const char * to_string(CompileErrorKind kind) noexcept
{
  switch (kind) {
    case CompileErrorKind::TypeMismatch:
      return "TypeMismatch";
    case CompileErrorKind::UndefinedToken:
      return "UndefinedToken";
    case CompileErrorKind::MissingField:
      return "MissingField";
    case CompileErrorKind::UnresolvedType:
      return "UnresolvedType";
    case CompileErrorKind::InfiniteType:
      return "InfiniteType";
    case CompileErrorKind::CyclicReference:
      return "CyclicReference";
    case CompileErrorKind::TraitBoundError:
      return "TraitBoundError";
    case CompileErrorKind::ArgumentCountMismatch:
      return "ArgumentCountMismatch";
    case CompileErrorKind::NoConverter:
      return "NoConverter";
    case CompileErrorKind::MissingChild:
      return "MissingChild";
    case CompileErrorKind::ChildTypeMismatch:
      return "ChildTypeMismatch";
  }
  return "Unknown";
}

}  // namespace rule_dsl

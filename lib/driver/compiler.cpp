// rule_dsl/driver/compiler.cpp - Rule compiler driver
//
#include "rule_dsl/driver/compiler.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>

#include "rule_dsl/sema/types/type_utils.hpp"

namespace rule_dsl
{

namespace
{

void dump_node(const TypedAst & ast, std::string_view label, size_t indent, std::string & out)
{
  out += fmt::format("{:{}}", "", indent);
  if (!label.empty()) {
    out += fmt::format("{}: ", label);
  }
  out += std::string(ast.kind());
  if (ast.token->literal()) {
    out += fmt::format("({})", *ast.token->literal());
  }
  out += fmt::format(" : {}\n", to_string(ast.type));

  for (const auto & [name, child] : ast.children) {
    dump_node(*child, name, indent + 2, out);
  }
}

}  // namespace

std::string dump_typed_ast(const TypedAst & ast)
{
  std::string out;
  dump_node(ast, {}, 0, out);
  return out;
}

RuleCompiler::RuleCompiler(CompileOptions options)
: options_(options), converters_(types_), checker_(types_, tokens_, traits_)
{
  traits_.register_builtins(types_);
  tokens_.register_builtins(types_);
  register_builtin_converters(converters_);
}

CheckResult RuleCompiler::check(const Token * root)
{
  return checker_.check(root, types_.action_type());
}

CompileResult RuleCompiler::compile(const Token * root)
{
  CompileResult result;

  CheckResult checked = check(root);
  if (!checked.success()) {
    result.diagnostics.add(checked.error->to_diagnostic());
    result.error = std::move(checked.error);
    return result;
  }

  if (options_.debug) {
    fmt::print(stderr, "[debug] typed AST:\n{}", dump_typed_ast(*checked.ast));
  }

  ConvertResult<ActionPtr> converted = converters_.convert<ActionPtr>(*checked.ast);
  if (!converted.success()) {
    result.diagnostics.add(converted.error->to_diagnostic());
    result.error = std::move(converted.error);
    return result;
  }

  result.success = true;
  result.node = std::move(converted.node);
  return result;
}

BatchCompileResult RuleCompiler::compile_many(const std::vector<const Token *> & roots)
{
  BatchCompileResult batch;

  for (const Token * root : roots) {
    CompileResult one = compile(root);
    batch.diagnostics.merge(std::move(one.diagnostics));
    if (one.success) {
      batch.rules.push_back(std::move(one.node));
    } else {
      batch.errors.push_back(std::move(*one.error));
    }
  }

  batch.success = batch.errors.empty();
  return batch;
}

}  // namespace rule_dsl

// rule_dsl/ast/token_json.hpp - JSON rule set loading
//
// Rule files have the shape
//
//   {"rules": [{"tokens": [{"type": "Strike", "target": {"type": "ActingCharacter"}}]}]}
//
// Every token is an object tagged by "type". Operands are nested token
// objects stored under their argument name; an integer "value" field is the
// token's inline literal.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rule_dsl/ast/token.hpp"
#include "rule_dsl/ast/token_context.hpp"

namespace rule_dsl
{

/**
 * Result of loading a rule set.
 *
 * Tokens are owned by the TokenContext passed to the loader.
 */
struct RuleSetLoadResult
{
  /// Root token of each rule, in file order
  std::vector<const Token *> rules;

  bool success = false;
  std::string error;

  static RuleSetLoadResult ok(std::vector<const Token *> rules)
  {
    RuleSetLoadResult r;
    r.rules = std::move(rules);
    r.success = true;
    return r;
  }

  static RuleSetLoadResult fail(std::string msg)
  {
    RuleSetLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Build a token tree from its JSON object form.
 *
 * @param j Token object
 * @param ctx Context that will own the tokens
 * @param error Set to a description of the problem on failure
 * @return The root token, or nullptr on failure
 */
[[nodiscard]] const Token * token_from_json(
  const nlohmann::json & j, TokenContext & ctx, std::string & error);

/**
 * Serialize a token tree back to its JSON object form.
 */
[[nodiscard]] nlohmann::json token_to_json(const Token * token);

/**
 * Parse a rule set from JSON text.
 */
[[nodiscard]] RuleSetLoadResult parse_rule_set(std::string_view text, TokenContext & ctx);

/**
 * Read and parse a rule set file.
 */
[[nodiscard]] RuleSetLoadResult load_rule_set(
  const std::filesystem::path & path, TokenContext & ctx);

}  // namespace rule_dsl

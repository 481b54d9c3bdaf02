// rule_dsl/ast/token_json.cpp - JSON rule set loading
//
#include "rule_dsl/ast/token_json.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace rule_dsl
{
namespace
{

using nlohmann::json;

constexpr const char * k_type_field = "type";

bool literal_from_json(const json & v, int32_t & out)
{
  if (!v.is_number_integer()) {
    return false;
  }
  const auto n = v.get<int64_t>();
  if (
    n < std::numeric_limits<int32_t>::min() || n > std::numeric_limits<int32_t>::max()) {
    return false;
  }
  out = static_cast<int32_t>(n);
  return true;
}

}  // namespace

const Token * token_from_json(const json & j, TokenContext & ctx, std::string & error)
{
  if (!j.is_object()) {
    error = "token must be a JSON object";
    return nullptr;
  }

  const auto type_it = j.find(k_type_field);
  if (type_it == j.end() || !type_it->is_string()) {
    error = "token is missing a string 'type' field";
    return nullptr;
  }
  const std::string type = type_it->get<std::string>();

  std::vector<TokenArg> args;
  std::optional<int32_t> literal;

  for (const auto & [key, value] : j.items()) {
    if (key == k_type_field) {
      continue;
    }

    if (key == k_literal_field && value.is_number()) {
      int32_t lit = 0;
      if (!literal_from_json(value, lit)) {
        error = "field 'value' of '" + type + "' must be a 32-bit integer";
        return nullptr;
      }
      literal = lit;
      continue;
    }

    if (!value.is_object()) {
      error = "field '" + key + "' of '" + type + "' must be a token object";
      return nullptr;
    }

    const Token * child = token_from_json(value, ctx, error);
    if (child == nullptr) {
      return nullptr;
    }
    args.push_back(TokenArg{ctx.intern(key), child});
  }

  return ctx.create(type, args, literal);
}

json token_to_json(const Token * token)
{
  json out = json::object();
  out[std::string(k_type_field)] = std::string(token->type());
  if (const auto lit = token->literal()) {
    out[std::string(k_literal_field)] = *lit;
  }
  for (const auto & a : token->args()) {
    out[std::string(a.name)] = token_to_json(a.value);
  }
  return out;
}

RuleSetLoadResult parse_rule_set(std::string_view text, TokenContext & ctx)
{
  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::exception & e) {
    return RuleSetLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }

  if (!root.is_object() || !root.contains("rules") || !root["rules"].is_array()) {
    return RuleSetLoadResult::fail("rule set must be an object with a 'rules' list");
  }

  std::vector<const Token *> rules;
  size_t index = 0;
  for (const auto & chain : root["rules"]) {
    const std::string where = "rules[" + std::to_string(index) + "]";
    ++index;

    if (!chain.is_object() || !chain.contains("tokens") || !chain["tokens"].is_array()) {
      return RuleSetLoadResult::fail(where + " must be an object with a 'tokens' list");
    }

    const auto & tokens = chain["tokens"];
    if (tokens.empty()) {
      return RuleSetLoadResult::fail(where + ": empty token chain");
    }
    if (tokens.size() > 1) {
      return RuleSetLoadResult::fail(
        where + ": expected exactly one root token, found " + std::to_string(tokens.size()));
    }

    std::string error;
    const Token * token = token_from_json(tokens.front(), ctx, error);
    if (token == nullptr) {
      return RuleSetLoadResult::fail(where + ": " + error);
    }
    rules.push_back(token);
  }

  return RuleSetLoadResult::ok(std::move(rules));
}

RuleSetLoadResult load_rule_set(const std::filesystem::path & path, TokenContext & ctx)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return RuleSetLoadResult::fail("rule file not found: " + path.string());
  }

  std::ifstream in(path);
  if (!in) {
    return RuleSetLoadResult::fail("failed to open rule file: " + path.string());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_rule_set(buffer.str(), ctx);
}

}  // namespace rule_dsl

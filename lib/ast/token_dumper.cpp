// rule_dsl/ast/token_dumper.cpp - Token tree rendering
#include "rule_dsl/ast/token_dumper.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <vector>

namespace rule_dsl
{

namespace
{

class TokenDumper
{
public:
  std::string run(const Token * token)
  {
    write(token, 0);
    return std::move(out_);
  }

private:
  void write(const Token * token, size_t indent)
  {
    if (token == nullptr) {
      out_ += "<null>";
      return;
    }

    if (std::find(stack_.begin(), stack_.end(), token) != stack_.end()) {
      out_ += fmt::format("<cycle: {}>", token->type());
      return;
    }

    if (token->args().empty()) {
      out_ += dump_token_head(token);
      return;
    }

    stack_.push_back(token);
    out_ += fmt::format("{} {{\n", token->type());
    if (token->literal()) {
      out_ += fmt::format(
        "{:{}}{}: {}\n", "", indent + 2, k_literal_field, *token->literal());
    }
    for (const auto & a : token->args()) {
      out_ += fmt::format("{:{}}{}: ", "", indent + 2, a.name);
      write(a.value, indent + 2);
      out_ += "\n";
    }
    out_ += fmt::format("{:{}}}}", "", indent);
    stack_.pop_back();
  }

  std::string out_;
  std::vector<const Token *> stack_;
};

}  // namespace

std::string dump_token(const Token * token) { return TokenDumper{}.run(token); }

std::string dump_token_head(const Token * token)
{
  if (token == nullptr) {
    return "<null>";
  }
  if (token->literal()) {
    return fmt::format("{} {{ {}: {} }}", token->type(), k_literal_field, *token->literal());
  }
  return std::string(token->type());
}

}  // namespace rule_dsl

// rule_dsl/sema/analysis/token_cycle_checker.cpp - Token graph cycle detection

#include "rule_dsl/sema/analysis/token_cycle_checker.hpp"

#include <cstdint>
#include <gsl/span>
#include <string>
#include <unordered_map>
#include <vector>

namespace rule_dsl
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

struct Frame
{
  const Token * token;
  std::string_view via;  ///< Argument of the parent leading here
};

std::string cycle_message(gsl::span<const Frame> stack, const Token * target)
{
  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start].token == target) {
      break;
    }
  }

  std::string msg;
  for (size_t i = start; i < stack.size(); ++i) {
    if (i > start) msg += " -> ";
    msg += std::string(stack[i].token->type());
  }
  msg += " -> ";
  msg += std::string(target->type());
  return msg;
}

std::vector<PathSegment> path_of(gsl::span<const Frame> stack, std::string_view last_arg)
{
  std::vector<PathSegment> path;
  for (size_t i = 0; i < stack.size(); ++i) {
    const std::string_view arg = (i + 1 < stack.size()) ? stack[i + 1].via : last_arg;
    path.push_back(PathSegment{std::string(stack[i].token->type()), std::string(arg)});
  }
  return path;
}

class CycleSearch
{
public:
  std::optional<CompileError> run(const Token * root)
  {
    visit(root, {});
    return std::move(error_);
  }

private:
  void visit(const Token * token, std::string_view via)
  {
    if (token == nullptr || error_) return;

    color_[token] = Color::Gray;
    stack_.push_back(Frame{token, via});

    for (const auto & a : token->args()) {
      if (a.value == nullptr) continue;

      const auto it = color_.find(a.value);
      const Color c = (it == color_.end()) ? Color::White : it->second;

      if (c == Color::Gray) {
        const gsl::span<const Frame> view(stack_.data(), stack_.size());
        error_ = CompileError::cyclic_reference(a.value->type(), cycle_message(view, a.value));
        error_->with_path(path_of(view, a.name)).with_token(a.value);
        return;
      }
      if (c == Color::White) {
        visit(a.value, a.name);
        if (error_) return;
      }
    }

    stack_.pop_back();
    color_[token] = Color::Black;
  }

  std::unordered_map<const Token *, Color> color_;
  std::vector<Frame> stack_;
  std::optional<CompileError> error_;
};

}  // namespace

std::optional<CompileError> TokenCycleChecker::check(const Token * root)
{
  return CycleSearch{}.run(root);
}

}  // namespace rule_dsl

// rule_dsl/ast/token_dumper.hpp - Human-readable token tree rendering
#pragma once

#include <string>

#include "rule_dsl/ast/token.hpp"

namespace rule_dsl
{

/**
 * Render a token tree in an indented, Rust-like debug form.
 *
 * Leaves print on one line (`ActingCharacter`, `Number { value: 5 }`);
 * tokens with operands print one operand per line:
 *
 *   Strike {
 *     target: ActingCharacter
 *   }
 *
 * A token that reappears among its own ancestors prints as `<cycle: Kind>`.
 */
[[nodiscard]] std::string dump_token(const Token * token);

/**
 * Render only the head of a token (kind plus literal), without operands.
 */
[[nodiscard]] std::string dump_token_head(const Token * token);

}  // namespace rule_dsl

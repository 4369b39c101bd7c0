#pragma once

#include <string>

#include "../lexer/token.hpp"

namespace sable::util {

// Source spelling of an operator token ("+", "<=", "and"), used by diagnostics and the AST printer.
std::string operator_token_to_string(lex::TokenType type);

} // namespace sable::util

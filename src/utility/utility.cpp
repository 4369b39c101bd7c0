#include "utility.hpp"

#include <unordered_map>

namespace sable::util {

std::string operator_token_to_string(lex::TokenType type)
{
    static const std::unordered_map<lex::TokenType, std::string> token_names = {
        {lex::TokenType::Plus, "+"},
        {lex::TokenType::Minus, "-"},
        {lex::TokenType::Star, "*"},
        {lex::TokenType::Slash, "/"},
        {lex::TokenType::EqualEqual, "=="},
        {lex::TokenType::BangEqual, "!="},
        {lex::TokenType::Less, "<"},
        {lex::TokenType::Greater, ">"},
        {lex::TokenType::LessEqual, "<="},
        {lex::TokenType::GreaterEqual, ">="},
        {lex::TokenType::And, "and"},
        {lex::TokenType::Or, "or"},
        {lex::TokenType::Bang, "!"}
    };
    auto it = token_names.find(type);
    return it != token_names.end() ? it->second : "unknown_operator";
}

} // namespace sable::util

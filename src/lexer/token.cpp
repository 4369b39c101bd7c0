#include "token.hpp"

#include <format>

namespace sable::lex {

std::string token_type_to_string(TokenType type)
{
    switch (type)
    {
        case TokenType::LeftParen:    return "LeftParen";
        case TokenType::RightParen:   return "RightParen";
        case TokenType::LeftBrace:    return "LeftBrace";
        case TokenType::RightBrace:   return "RightBrace";
        case TokenType::Comma:        return "Comma";
        case TokenType::Dot:          return "Dot";
        case TokenType::Minus:        return "Minus";
        case TokenType::Plus:         return "Plus";
        case TokenType::Semicolon:    return "Semicolon";
        case TokenType::Slash:        return "Slash";
        case TokenType::Star:         return "Star";

        case TokenType::Bang:         return "Bang";
        case TokenType::BangEqual:    return "BangEqual";
        case TokenType::Equal:        return "Equal";
        case TokenType::EqualEqual:   return "EqualEqual";
        case TokenType::Greater:      return "Greater";
        case TokenType::GreaterEqual: return "GreaterEqual";
        case TokenType::Less:         return "Less";
        case TokenType::LessEqual:    return "LessEqual";

        case TokenType::Identifier:   return "Identifier";
        case TokenType::String:       return "String";
        case TokenType::Number:       return "Number";

        case TokenType::And:          return "And";
        case TokenType::Class:        return "Class";
        case TokenType::Else:         return "Else";
        case TokenType::False:        return "False";
        case TokenType::Fun:          return "Fun";
        case TokenType::For:          return "For";
        case TokenType::If:           return "If";
        case TokenType::Nil:          return "Nil";
        case TokenType::Or:           return "Or";
        case TokenType::Print:        return "Print";
        case TokenType::Return:       return "Return";
        case TokenType::Super:        return "Super";
        case TokenType::This:         return "This";
        case TokenType::True:         return "True";
        case TokenType::Var:          return "Var";
        case TokenType::While:        return "While";
        case TokenType::Eof:          return "Eof";
    }
    return "Unknown";
}

std::string literal_to_string(const Literal &literal)
{
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>)
                return "null";
            else if constexpr (std::is_same_v<T, Identifier_name>)
                return v.name;
            else if constexpr (std::is_same_v<T, std::string>)
                return "\"" + v + "\"";
            else if constexpr (std::is_same_v<T, double>)
                return std::format("{}", v);
            else
                return v ? "true" : "false";
        },
        literal);
}

std::string token_to_string(const Token &token)
{
    return std::format("{}:{} {} '{}' {}", token.line, token.column, token_type_to_string(token.type), token.lexeme,
                       literal_to_string(token.literal));
}

std::vector<std::string> token_types_to_strings(const std::vector<TokenType> &types)
{
    std::vector<std::string> names;
    names.reserve(types.size());
    for (auto type : types) names.push_back(token_type_to_string(type));
    return names;
}

} // namespace sable::lex

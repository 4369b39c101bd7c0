#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sable {
namespace lex {

enum class TokenType : uint8_t
{
    // Single-character tokens.
    LeftParen, RightParen, LeftBrace, RightBrace, Comma, Dot, Minus, Plus, Semicolon, Slash, Star,

    // One or two character tokens.
    Bang, BangEqual, Equal, EqualEqual, Greater, GreaterEqual, Less, LessEqual,

    // Literals.
    Identifier, String, Number,

    // Keywords.
    And, Class, Else, False, Fun, For, If, Nil, Or, Print, Return, Super, This, True, Var, While,

    Eof
};

struct Identifier_name
{
    std::string name;
    bool operator==(const Identifier_name &) const = default;
};

// null | identifier-name | string | number | true/false
using Literal = std::variant<std::nullptr_t, Identifier_name, std::string, double, bool>;

struct Token
{
    TokenType type;
    std::string lexeme;
    Literal literal;
    size_t line;
    size_t column;
    Token(TokenType t, std::string lex, Literal lit, size_t l, size_t c)
        : type(t), lexeme(std::move(lex)), literal(std::move(lit)), line(l), column(c) {}
};

static const std::unordered_map<std::string_view, TokenType> token_keywords = {
    {"and",    TokenType::And},    {"class",  TokenType::Class},
    {"else",   TokenType::Else},   {"false",  TokenType::False},
    {"for",    TokenType::For},    {"fun",    TokenType::Fun},
    {"if",     TokenType::If},     {"nil",    TokenType::Nil},
    {"or",     TokenType::Or},     {"print",  TokenType::Print},
    {"return", TokenType::Return}, {"super",  TokenType::Super},
    {"this",   TokenType::This},   {"true",   TokenType::True},
    {"var",    TokenType::Var},    {"while",  TokenType::While}
};

std::string token_type_to_string(TokenType type);
std::string literal_to_string(const Literal &literal);
std::string token_to_string(const Token &token);
std::vector<std::string> token_types_to_strings(const std::vector<TokenType> &types);

} // namespace lex
} // namespace sable

#include "lexer.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <system_error>

namespace sable::lex {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
bool is_alnum(char c) { return is_alpha(c) || is_digit(c); }

}  // namespace

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (!is_at_end())
        if (auto token = scan_token(); token.has_value())
            tokens.push_back(std::move(*token));
    tokens.emplace_back(TokenType::Eof, "", nullptr, line, column);
    return tokens;
}

char Lexer::advance()
{
    column++;
    return source[current++];
}

bool Lexer::match(char expected)
{
    if (is_at_end() || source[current] != expected)
        return false;
    current++;
    column++;
    return true;
}

void Lexer::newline()
{
    line++;
    column = 1;
}

void Lexer::report(err::Kind kind, std::string message, size_t l, size_t c)
{
    errors_.emplace_back(std::move(message), err::Phase::Lexing, kind, l, c);
}

std::optional<Token> Lexer::scan_token()
{
    size_t start_col = column;
    char c = advance();
    switch (c)
    {
        case ' ':
        case '\r':
        case '\t':
            return std::nullopt;
        case '\n':
            newline();
            return std::nullopt;
        case '(': return Token(TokenType::LeftParen, "(", nullptr, line, start_col);
        case ')': return Token(TokenType::RightParen, ")", nullptr, line, start_col);
        case '{': return Token(TokenType::LeftBrace, "{", nullptr, line, start_col);
        case '}': return Token(TokenType::RightBrace, "}", nullptr, line, start_col);
        case ',': return Token(TokenType::Comma, ",", nullptr, line, start_col);
        case '.': return Token(TokenType::Dot, ".", nullptr, line, start_col);
        case '-': return Token(TokenType::Minus, "-", nullptr, line, start_col);
        case '+': return Token(TokenType::Plus, "+", nullptr, line, start_col);
        case ';': return Token(TokenType::Semicolon, ";", nullptr, line, start_col);
        case '*': return Token(TokenType::Star, "*", nullptr, line, start_col);
        case '!':
            if (match('='))
                return Token(TokenType::BangEqual, "!=", nullptr, line, start_col);
            return Token(TokenType::Bang, "!", nullptr, line, start_col);
        case '=':
            if (match('='))
                return Token(TokenType::EqualEqual, "==", nullptr, line, start_col);
            return Token(TokenType::Equal, "=", nullptr, line, start_col);
        case '<':
            if (match('='))
                return Token(TokenType::LessEqual, "<=", nullptr, line, start_col);
            return Token(TokenType::Less, "<", nullptr, line, start_col);
        case '>':
            if (match('='))
                return Token(TokenType::GreaterEqual, ">=", nullptr, line, start_col);
            return Token(TokenType::Greater, ">", nullptr, line, start_col);
        case '/':
            if (match('/'))
            {
                while (peek() != '\n' && !is_at_end()) advance();
                return std::nullopt;
            }
            if (match('*'))
            {
                skip_block_comment();
                return std::nullopt;
            }
            return Token(TokenType::Slash, "/", nullptr, line, start_col);
        case '"':
            return scan_string();
        default:
            if (is_digit(c))
                return scan_number();
            if (is_alpha(c))
                return scan_identifier();
            break;
    }
    report(err::Kind::Unexpected_character, std::format("Unexpected character '{}'", c), line, start_col);
    return std::nullopt;
}

void Lexer::skip_block_comment()
{
    // Runs to end of input when the closing marker is missing.
    while (!is_at_end())
    {
        if (peek() == '*' && peek_next() == '/')
        {
            advance();
            advance();
            return;
        }
        if (advance() == '\n')
            newline();
    }
}

std::optional<Token> Lexer::scan_string()
{
    size_t start = current - 1, start_line = line, start_col = column - 1;
    while (peek() != '"' && !is_at_end())
    {
        if (advance() == '\n')
            newline();
    }
    if (is_at_end())
    {
        report(err::Kind::Unterminated_string, "Unterminated string", start_line, start_col);
        return std::nullopt;
    }
    advance();  // closing quote

    std::string lexeme(source.substr(start, current - start));
    std::string value = lexeme.substr(1, lexeme.size() - 2);
    return Token(TokenType::String, std::move(lexeme), std::move(value), start_line, start_col);
}

Token Lexer::scan_number()
{
    size_t start = current - 1, start_col = column - 1;
    while (is_digit(peek())) advance();
    if (peek() == '.' && is_digit(peek_next()))
    {
        advance();
        while (is_digit(peek())) advance();
    }
    std::string lexeme(source.substr(start, current - start));

    double value = 0.0;
    auto [_, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), value);
    // from_chars leaves the value untouched on overflow; strtod saturates to HUGE_VAL or underflows to 0.
    if (ec == std::errc::result_out_of_range)
        value = std::strtod(lexeme.c_str(), nullptr);
    return Token(TokenType::Number, lexeme, value, line, start_col);
}

Token Lexer::scan_identifier()
{
    size_t start = current - 1, start_col = column - 1;
    while (is_alnum(peek())) advance();

    std::string lexeme(source.substr(start, current - start));
    auto it = token_keywords.find(lexeme);
    if (it == token_keywords.end())
        return Token(TokenType::Identifier, lexeme, Identifier_name{lexeme}, line, start_col);

    Literal literal = nullptr;
    if (it->second == TokenType::True)
        literal = true;
    else if (it->second == TokenType::False)
        literal = false;
    return Token(it->second, std::move(lexeme), std::move(literal), line, start_col);
}

} // namespace sable::lex

#pragma once

#include "./token.hpp"
#include "../error/err.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sable {
namespace lex {

// Single pass scanner. Bad input is recorded and skipped so that one scan
// reports every lexical error; the token stream always ends with Eof.
class Lexer
{
private:
    std::string_view source;
    size_t current = 0;
    size_t line = 1, column = 1;
    std::vector<err::msg> errors_;

public:
    explicit Lexer(std::string_view src) : source(src) {}

    std::vector<Token> tokenize();

    bool had_error() const { return !errors_.empty(); }
    const std::vector<err::msg> &errors() const { return errors_; }

private:
    bool is_at_end() const { return current >= source.length(); }
    char advance();
    char peek() const { return is_at_end() ? '\0' : source[current]; }
    char peek_next() const { return current + 1 >= source.length() ? '\0' : source[current + 1]; }
    bool match(char expected);
    void newline();

    void report(err::Kind kind, std::string message, size_t l, size_t c);

    std::optional<Token> scan_token();
    std::optional<Token> scan_string();
    Token scan_number();
    Token scan_identifier();
    void skip_block_comment();
};

} // namespace lex
} // namespace sable

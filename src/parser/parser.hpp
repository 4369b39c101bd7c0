#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "../lexer/token.hpp"
#include "../error/result.hpp"
#include "../error/err.hpp"
#include "../memory/arena.hpp"
#include "ast.hpp"

namespace sable
{

class Parser
{
public:
    static constexpr size_t MAX_ARGUMENTS = 255;

    explicit Parser(std::vector<lex::Token> tokens, mem::Arena &arena, std::string filename = "")
        : arena_(arena), tokens_(std::move(tokens)), filename_(std::move(filename)) {}

    // Parses the whole token stream. Every error is reported to stderr as it
    // is found and kept in errors(); parsing resumes at the next statement.
    std::vector<ast::Stmt*> parse();

    bool had_error() const { return !errors_.empty(); }
    const std::vector<err::msg> &errors() const { return errors_; }

private:
    mem::Arena &arena_;
    std::vector<lex::Token> tokens_;
    std::string filename_;
    size_t current_ = 0;
    size_t function_depth_ = 0;
    std::vector<err::msg> errors_;

    // --- Utility Methods ---
    const lex::Token &peek() const;
    const lex::Token &previous() const;
    const lex::Token &advance();
    bool match(std::initializer_list<lex::TokenType> types);
    Result<lex::Token> consume(lex::TokenType type, const std::string &message);
    bool check(lex::TokenType type) const { return peek().type == type; }
    bool is_at_end() const { return peek().type == lex::TokenType::Eof; }
    err::msg create_error(err::Kind kind, const lex::Token &token, const std::string &message) const;
    void synchronize();

    template <typename Node>
    ast::Expr *make_expr(Node node) { return mem::Arena::alloc(arena_, ast::Expr{std::move(node)}); }
    template <typename Node>
    ast::Stmt *make_stmt(Node node) { return mem::Arena::alloc(arena_, ast::Stmt{std::move(node)}); }

    // --- Declaration Parsers ---
    Result<ast::Stmt*> declaration();
    Result<ast::Stmt*> function_declaration();
    Result<ast::Stmt*> var_declaration();

    // --- Statement Parsers ---
    Result<ast::Stmt*> statement();
    Result<ast::Stmt*> print_statement();
    Result<ast::Stmt*> block_statement();
    Result<std::vector<ast::Stmt*>> block();
    Result<ast::Stmt*> if_statement();
    Result<ast::Stmt*> while_statement();
    Result<ast::Stmt*> for_statement();
    Result<ast::Stmt*> return_statement();
    Result<ast::Stmt*> expression_statement();

    // --- Expression Parsers (by precedence) ---
    Result<ast::Expr*> expression();
    Result<ast::Expr*> assignment();
    Result<ast::Expr*> logical_or();
    Result<ast::Expr*> logical_and();
    Result<ast::Expr*> equality();
    Result<ast::Expr*> comparison();
    Result<ast::Expr*> term();
    Result<ast::Expr*> factor();
    Result<ast::Expr*> unary();
    Result<ast::Expr*> call();
    Result<ast::Expr*> finish_call(ast::Expr *callee);
    Result<ast::Expr*> primary();
};

} // namespace sable

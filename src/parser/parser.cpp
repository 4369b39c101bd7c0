#include "parser.hpp"

#include <cstddef>
#include <print>
#include <string>
#include <utility>
#include <vector>
#include <variant>
#include <expected>

#include "../lexer/token.hpp"
#include "../error/err.hpp"
#include "../error/result.hpp"
#include "../utility/try_res.hpp"

namespace sable {

std::vector<ast::Stmt*> Parser::parse()
{
    std::vector<ast::Stmt*> statements;
    while (!is_at_end())
    {
        auto decl_result = declaration();
        if (!decl_result)
        {
            auto error = std::move(decl_result.error());
            error.filename = filename_;
            std::println(stderr, "{}", error.format());
            errors_.push_back(std::move(error));

            synchronize();
            continue; // Continue parsing to find more errors
        }
        statements.push_back(*decl_result);
    }
    return statements;
}

const lex::Token &Parser::peek() const
{
    if (current_ >= tokens_.size())
    {
        static const lex::Token eof_token(lex::TokenType::Eof, "", nullptr, 0, 0);
        return tokens_.empty() ? eof_token : tokens_.back();
    }
    return tokens_[current_];
}

const lex::Token &Parser::previous() const
{
    if (current_ == 0)
        return peek();
    return tokens_[current_ - 1];
}

const lex::Token &Parser::advance()
{
    if (!is_at_end())
        current_++;
    return previous();
}

bool Parser::match(std::initializer_list<lex::TokenType> types)
{
    for (auto type : types)
    {
        if (check(type))
        {
            advance();
            return true;
        }
    }
    return false;
}

Result<lex::Token> Parser::consume(lex::TokenType type, const std::string &message)
{
    if (check(type))
        return advance();

    auto error = create_error(err::Kind::Unexpected_token, peek(), message);
    error.expected = {lex::token_type_to_string(type)};
    return std::unexpected(std::move(error));
}

err::msg Parser::create_error(err::Kind kind, const lex::Token &token, const std::string &message) const
{
    err::msg error(message, err::Phase::Parsing, kind, token.line, token.column);
    error.found = lex::token_type_to_string(token.type);
    return error;
}

void Parser::synchronize()
{
    advance();
    while (!is_at_end())
    {
        if (previous().type == lex::TokenType::Semicolon)
            return;
        switch (peek().type)
        {
            case lex::TokenType::Class:
            case lex::TokenType::Fun:
            case lex::TokenType::Var:
            case lex::TokenType::For:
            case lex::TokenType::If:
            case lex::TokenType::While:
            case lex::TokenType::Print:
            case lex::TokenType::Return:
                return;
            default:
                advance();
        }
    }
}

Result<ast::Stmt*> Parser::declaration()
{
    if (match({lex::TokenType::Fun})) return function_declaration();
    if (match({lex::TokenType::Var})) return var_declaration();
    return statement();
}

Result<ast::Stmt*> Parser::function_declaration()
{
    lex::Token name = __Try(consume(lex::TokenType::Identifier, "Expect function name"));
    __TryVoid(consume(lex::TokenType::LeftParen, "Expect '(' after function name"));

    std::vector<std::string> parameters;
    if (!check(lex::TokenType::RightParen))
    {
        do {
            if (parameters.size() >= MAX_ARGUMENTS)
                return std::unexpected(create_error(err::Kind::Too_many_arguments, peek(), "Can't have more than 255 parameters"));
            auto param = __Try(consume(lex::TokenType::Identifier, "Expect parameter name"));
            parameters.push_back(param.lexeme);
        } while (match({lex::TokenType::Comma}));
    }
    __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after parameters"));
    __TryVoid(consume(lex::TokenType::LeftBrace, "Expect '{' before function body"));

    function_depth_++;
    auto body = block();
    function_depth_--;
    if (!body)
        return std::unexpected(body.error());

    return make_stmt(ast::Function_stmt {
        .name = name.lexeme,
        .parameters = std::move(parameters),
        .body = std::move(*body),
        .loc = {name.line, name.column}
    });
}

Result<ast::Stmt*> Parser::var_declaration()
{
    auto name = __Try(consume(lex::TokenType::Identifier, "Expect variable name"));

    ast::Expr* initializer = nullptr;
    if (match({lex::TokenType::Equal}))
        initializer = __Try(expression());

    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after variable declaration"));

    return make_stmt(ast::Var_stmt {
        .name = name.lexeme,
        .initializer = initializer,
        .loc = {name.line, name.column},
    });
}

Result<ast::Stmt*> Parser::statement()
{
    if (match({lex::TokenType::Print}))
        return print_statement();
    if (match({lex::TokenType::LeftBrace}))
        return block_statement();
    if (match({lex::TokenType::If}))
        return if_statement();
    if (match({lex::TokenType::While}))
        return while_statement();
    if (match({lex::TokenType::For}))
        return for_statement();
    if (match({lex::TokenType::Return}))
        return return_statement();
    return expression_statement();
}

Result<ast::Stmt*> Parser::print_statement()
{
    lex::Token keyword = previous();
    auto value = __Try(expression());
    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after value"));

    return make_stmt(ast::Print_stmt {
        .expression = value,
        .loc = {keyword.line, keyword.column}
    });
}

Result<ast::Stmt*> Parser::block_statement()
{
    lex::Token brace = previous();
    auto statements = __Try(block());

    return make_stmt(ast::Block_stmt {
        .statements = std::move(statements),
        .loc = {brace.line, brace.column}
    });
}

Result<std::vector<ast::Stmt*>> Parser::block()
{
    std::vector<ast::Stmt*> statements;
    while (!check(lex::TokenType::RightBrace) && !is_at_end())
        statements.push_back(__Try(declaration()));

    __TryVoid(consume(lex::TokenType::RightBrace, "Expect '}' after block"));
    return statements;
}

Result<ast::Stmt*> Parser::if_statement()
{
    lex::Token keyword = previous();
    __TryVoid(consume(lex::TokenType::LeftParen, "Expect '(' after 'if'"));
    auto condition = __Try(expression());
    __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after if condition"));

    auto then_branch = __Try(statement());
    ast::Stmt* else_branch = nullptr;
    if (match({lex::TokenType::Else}))
        else_branch = __Try(statement());

    return make_stmt(ast::If_stmt {
        .condition = condition,
        .then_branch = then_branch,
        .else_branch = else_branch,
        .loc = {keyword.line, keyword.column}
    });
}

Result<ast::Stmt*> Parser::while_statement()
{
    lex::Token keyword = previous();
    __TryVoid(consume(lex::TokenType::LeftParen, "Expect '(' after 'while'"));
    auto condition = __Try(expression());
    __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after condition"));
    auto body = __Try(statement());

    return make_stmt(ast::While_stmt {
        .condition = condition,
        .body = body,
        .loc = {keyword.line, keyword.column}
    });
}

// for (init; cond; incr) body  =>  { init; while (cond) { body; incr; } }
Result<ast::Stmt*> Parser::for_statement()
{
    lex::Token keyword = previous();
    ast::Source_location loc{keyword.line, keyword.column};
    __TryVoid(consume(lex::TokenType::LeftParen, "Expect '(' after 'for'"));

    ast::Stmt* initializer = nullptr;
    if (match({lex::TokenType::Semicolon})) {}
    else if (match({lex::TokenType::Var}))
        initializer = __Try(var_declaration());
    else
        initializer = __Try(expression_statement());

    ast::Expr* condition = nullptr;
    if (!check(lex::TokenType::Semicolon))
        condition = __Try(expression());
    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after loop condition"));

    ast::Expr* increment = nullptr;
    if (!check(lex::TokenType::RightParen))
        increment = __Try(expression());
    __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after for clauses"));

    auto body = __Try(statement());

    if (increment != nullptr)
    {
        auto *step = make_stmt(ast::Expr_stmt{increment, ast::get_loc(increment->node)});
        body = make_stmt(ast::Block_stmt{{body, step}, loc});
    }

    if (condition == nullptr)
        condition = make_expr(ast::Literal_expr{true, loc});
    body = make_stmt(ast::While_stmt{condition, body, loc});

    if (initializer != nullptr)
        body = make_stmt(ast::Block_stmt{{initializer, body}, loc});

    return body;
}

Result<ast::Stmt*> Parser::return_statement()
{
    lex::Token keyword = previous();
    if (function_depth_ == 0)
        return std::unexpected(create_error(err::Kind::Return_outside_function, keyword, "Can't return from top-level code"));

    ast::Expr* value = nullptr;
    if (!check(lex::TokenType::Semicolon))
        value = __Try(expression());
    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after return value"));

    return make_stmt(ast::Return_stmt{value, {keyword.line, keyword.column}});
}

Result<ast::Stmt*> Parser::expression_statement()
{
    auto expr = __Try(expression());
    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after expression"));
    return make_stmt(ast::Expr_stmt{expr, ast::get_loc(expr->node)});
}

Result<ast::Expr*> Parser::expression() { return assignment(); }

Result<ast::Expr*> Parser::assignment()
{
    auto expr = __Try(logical_or());

    if (match({lex::TokenType::Equal}))
    {
        lex::Token equals = previous();
        auto value = __Try(assignment());

        if (auto *var_expr = std::get_if<ast::Variable_expr>(&expr->node))
        {
            return make_expr(ast::Assignment_expr {
                .name = var_expr->name,
                .value = value,
                .loc = {equals.line, equals.column}
            });
        }
        return std::unexpected(create_error(err::Kind::Invalid_assignment_target, equals, "Invalid assignment target"));
    }
    return expr;
}

Result<ast::Expr*> Parser::logical_or()
{
    auto expr = __Try(logical_and());

    while (match({lex::TokenType::Or}))
    {
        lex::Token op = previous();
        auto right = __Try(logical_and());
        expr = make_expr(ast::Logical_expr{expr, op.type, right, {op.line, op.column}});
    }
    return expr;
}

Result<ast::Expr*> Parser::logical_and()
{
    auto expr = __Try(equality());

    while (match({lex::TokenType::And}))
    {
        lex::Token op = previous();
        auto right = __Try(equality());
        expr = make_expr(ast::Logical_expr{expr, op.type, right, {op.line, op.column}});
    }
    return expr;
}

Result<ast::Expr*> Parser::equality()
{
    auto expr = __Try(comparison());

    while (match({lex::TokenType::BangEqual, lex::TokenType::EqualEqual}))
    {
        lex::Token op = previous();
        auto right = __Try(comparison());
        expr = make_expr(ast::Binary_expr{expr, op.type, right, {op.line, op.column}});
    }
    return expr;
}

Result<ast::Expr*> Parser::comparison()
{
    auto expr = __Try(term());

    while (match({lex::TokenType::Greater, lex::TokenType::GreaterEqual, lex::TokenType::Less, lex::TokenType::LessEqual}))
    {
        lex::Token op = previous();
        auto right = __Try(term());
        expr = make_expr(ast::Binary_expr{expr, op.type, right, {op.line, op.column}});
    }
    return expr;
}

Result<ast::Expr*> Parser::term()
{
    auto expr = __Try(factor());

    while (match({lex::TokenType::Minus, lex::TokenType::Plus}))
    {
        lex::Token op = previous();
        auto right = __Try(factor());
        expr = make_expr(ast::Binary_expr{expr, op.type, right, {op.line, op.column}});
    }
    return expr;
}

Result<ast::Expr*> Parser::factor()
{
    auto expr = __Try(unary());

    while (match({lex::TokenType::Star, lex::TokenType::Slash}))
    {
        lex::Token op = previous();
        auto right = __Try(unary());
        expr = make_expr(ast::Binary_expr{expr, op.type, right, {op.line, op.column}});
    }
    return expr;
}

Result<ast::Expr*> Parser::unary()
{
    if (match({lex::TokenType::Bang, lex::TokenType::Minus}))
    {
        lex::Token op = previous();
        auto right = __Try(unary());
        return make_expr(ast::Unary_expr{op.type, right, {op.line, op.column}});
    }
    return call();
}

Result<ast::Expr*> Parser::call()
{
    auto expr = __Try(primary());

    while (match({lex::TokenType::LeftParen}))
        expr = __Try(finish_call(expr));

    return expr;
}

Result<ast::Expr*> Parser::finish_call(ast::Expr *callee)
{
    std::vector<ast::Expr*> arguments;
    if (!check(lex::TokenType::RightParen))
    {
        do {
            if (arguments.size() >= MAX_ARGUMENTS)
                return std::unexpected(create_error(err::Kind::Too_many_arguments, peek(), "Can't have more than 255 arguments"));
            arguments.push_back(__Try(expression()));
        } while (match({lex::TokenType::Comma}));
    }
    auto paren = __Try(consume(lex::TokenType::RightParen, "Expect ')' after arguments"));

    return make_expr(ast::Call_expr {
        .callee = callee,
        .arguments = std::move(arguments),
        .loc = {paren.line, paren.column}
    });
}

Result<ast::Expr*> Parser::primary()
{
    if (match({lex::TokenType::False, lex::TokenType::True, lex::TokenType::Nil, lex::TokenType::Number, lex::TokenType::String}))
    {
        const auto &literal = previous();
        return make_expr(ast::Literal_expr{literal.literal, {literal.line, literal.column}});
    }

    if (match({lex::TokenType::Identifier}))
    {
        const auto &id = previous();
        return make_expr(ast::Variable_expr{id.lexeme, {id.line, id.column}});
    }

    if (match({lex::TokenType::LeftParen}))
    {
        lex::Token paren = previous();
        auto inner = __Try(expression());
        __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after expression"));
        return make_expr(ast::Grouping_expr{inner, {paren.line, paren.column}});
    }

    auto error = create_error(err::Kind::Expected_expression, peek(), "Expect expression");
    error.expected = lex::token_types_to_strings({lex::TokenType::False, lex::TokenType::True, lex::TokenType::Nil,
                                                   lex::TokenType::Number, lex::TokenType::String,
                                                   lex::TokenType::Identifier, lex::TokenType::LeftParen});
    return std::unexpected(std::move(error));
}

} // namespace sable

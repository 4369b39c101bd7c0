#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <variant>

#include "../lexer/token.hpp"

namespace sable::ast
{

struct Source_location
{
    size_t line = 0;
    size_t column = 0;
};

// =================================
// Expression node types
// =================================
struct Literal_expr
{
    lex::Literal value;
    Source_location loc;
};

struct Variable_expr
{
    std::string name;
    Source_location loc;
};

struct Unary_expr
{
    lex::TokenType op;
    struct Expr* right;
    Source_location loc;
};

struct Binary_expr
{
    struct Expr* left;
    lex::TokenType op;
    struct Expr* right;
    Source_location loc;
};

// `and` / `or`: the right operand is only evaluated when needed.
struct Logical_expr
{
    struct Expr* left;
    lex::TokenType op;
    struct Expr* right;
    Source_location loc;
};

struct Call_expr
{
    struct Expr* callee;
    std::vector<struct Expr*> arguments;
    Source_location loc;  // closing paren
};

struct Grouping_expr
{
    struct Expr* expression;
    Source_location loc;
};

struct Assignment_expr
{
    std::string name;
    struct Expr* value;
    Source_location loc;
};

// =================================
// Unified expression wrapper
// =================================
struct Expr
{
    using Node = std::variant<Literal_expr, Variable_expr, Unary_expr, Binary_expr, Logical_expr, Call_expr,
                              Grouping_expr, Assignment_expr>;

    Node node;
};

// =================================
// Statement node types
// =================================
struct Expr_stmt
{
    Expr* expression;
    Source_location loc;
};

struct Print_stmt
{
    Expr* expression;
    Source_location loc;
};

struct Var_stmt
{
    std::string name;
    Expr* initializer;  // nullptr: declared but uninitialized
    Source_location loc;
};

struct Block_stmt
{
    std::vector<struct Stmt*> statements;
    Source_location loc;
};

struct If_stmt
{
    Expr* condition;
    struct Stmt* then_branch;
    struct Stmt* else_branch;
    Source_location loc;
};

struct While_stmt
{
    Expr* condition;
    struct Stmt* body;
    Source_location loc;
};

struct Function_stmt
{
    std::string name;
    std::vector<std::string> parameters;
    std::vector<struct Stmt*> body;
    Source_location loc;
};

struct Return_stmt
{
    Expr* value;
    Source_location loc;
};

// =================================
// Unified statement wrapper
// =================================
struct Stmt
{
    using Node = std::variant<Expr_stmt, Print_stmt, Var_stmt, Block_stmt, If_stmt, While_stmt, Function_stmt,
                              Return_stmt>;

    Node node;
};

inline Source_location get_loc(const Expr::Node &node)
{
    return std::visit([](auto const &expr) -> Source_location { return expr.loc; }, node);
}

inline Source_location get_loc(const Stmt::Node &node)
{
    return std::visit([](auto const &stmt) -> Source_location { return stmt.loc; }, node);
}

}  // namespace sable::ast

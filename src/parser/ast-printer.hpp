#pragma once

#include <cstdio>
#include <vector>
#include <string>

#include "ast.hpp"

namespace sable::ast
{

class AstPrinter
{
public:
    explicit AstPrinter(bool unicode = true, std::FILE *out = stdout);
    void print_statements(const std::vector<Stmt *> &statements);
    bool use_unicode;

private:
    std::FILE *out_;
    std::vector<bool> branch_stack;

    void print_expr_ptr(const Expr *expr);
    void print_stmt_ptr(const Stmt *stmt);

    // --- Expression Visitors ---
    void print_expr_node(const Literal_expr &node);
    void print_expr_node(const Variable_expr &node);
    void print_expr_node(const Unary_expr &node);
    void print_expr_node(const Binary_expr &node);
    void print_expr_node(const Logical_expr &node);
    void print_expr_node(const Call_expr &node);
    void print_expr_node(const Grouping_expr &node);
    void print_expr_node(const Assignment_expr &node);

    // --- Statement Visitors ---
    void print_stmt_node(const Expr_stmt &node);
    void print_stmt_node(const Print_stmt &node);
    void print_stmt_node(const Var_stmt &node);
    void print_stmt_node(const Block_stmt &node);
    void print_stmt_node(const If_stmt &node);
    void print_stmt_node(const While_stmt &node);
    void print_stmt_node(const Function_stmt &node);
    void print_stmt_node(const Return_stmt &node);

    // --- Helper Methods ---
    std::string branch_sym(bool has_next) const;
    std::string vertical_sym(bool has_next) const;
    void indent() const;
    void print_str(const std::string &s) const;
    void print_labeled(bool has_next, const std::string &label, const Expr *expr);

    template <typename F>
    void with_child(bool has_next, F f)
    {
        branch_stack.push_back(has_next);
        f();
        branch_stack.pop_back();
    }
};

}  // namespace sable::ast

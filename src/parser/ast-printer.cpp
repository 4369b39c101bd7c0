#include "ast-printer.hpp"
#include "../utility/utility.hpp"
#include "ast.hpp"

#include <print>

namespace sable::ast {

// ---------- private utils ----------

std::string AstPrinter::branch_sym(bool has_next) const {
    return use_unicode ? (has_next ? "├── " : "└── ")
                       : (has_next ? "+-- " : "\\-- ");
}

std::string AstPrinter::vertical_sym(bool has_next) const {
    return use_unicode ? (has_next ? "│   " : "    ")
                       : (has_next ? "|   " : "    ");
}

void AstPrinter::indent() const
{
    for (size_t i = 0; i + 1 < branch_stack.size(); ++i)
        std::print(out_, "{}", vertical_sym(branch_stack[i]));
    if (!branch_stack.empty())
        std::print(out_, "{}", branch_sym(branch_stack.back()));
}

void AstPrinter::print_str(const std::string &s) const { std::println(out_, "{}", s); }

void AstPrinter::print_labeled(bool has_next, const std::string &label, const Expr *expr)
{
    with_child(has_next,
               [&]
               {
                   indent();
                   print_str(label);
                   with_child(false, [&] { print_expr_ptr(expr); });
               });
}

// ---------- public ----------

AstPrinter::AstPrinter(bool unicode, std::FILE *out) : use_unicode(unicode), out_(out) {}

void AstPrinter::print_statements(const std::vector<Stmt*> &statements)
{
    for (size_t i = 0; i < statements.size(); ++i)
        with_child(i + 1 < statements.size(), [&] { print_stmt_ptr(statements[i]); });
}

void AstPrinter::print_expr_ptr(const Expr* expr)
{
    if (!expr)
    {
        indent();
        print_str("<nullptr>");
        return;
    }
    std::visit([this](auto const& e) { this->print_expr_node(e); }, expr->node);
}

void AstPrinter::print_stmt_ptr(const Stmt* stmt)
{
    if (!stmt)
    {
        indent();
        print_str("<nullptr>");
        return;
    }
    std::visit([this](auto const& s) { this->print_stmt_node(s); }, stmt->node);
}

// ---------- Expressions ----------

void AstPrinter::print_expr_node(const Literal_expr &node)
{
    indent();
    print_str("Literal: " + lex::literal_to_string(node.value));
}

void AstPrinter::print_expr_node(const Variable_expr &node)
{
    indent();
    print_str("Variable: " + node.name);
}

void AstPrinter::print_expr_node(const Unary_expr &node)
{
    indent();
    print_str("Unary_expr");
    with_child(true,
               [&]
               {
                   indent();
                   print_str("Operator: " + util::operator_token_to_string(node.op));
               });
    print_labeled(false, "Right", node.right);
}

void AstPrinter::print_expr_node(const Binary_expr &node)
{
    indent();
    print_str("Binary_expr");
    with_child(true,
               [&]
               {
                   indent();
                   print_str("Operator: " + util::operator_token_to_string(node.op));
               });
    print_labeled(true, "Left", node.left);
    print_labeled(false, "Right", node.right);
}

void AstPrinter::print_expr_node(const Logical_expr &node)
{
    indent();
    print_str("Logical_expr");
    with_child(true,
               [&]
               {
                   indent();
                   print_str("Operator: " + util::operator_token_to_string(node.op));
               });
    print_labeled(true, "Left", node.left);
    print_labeled(false, "Right", node.right);
}

void AstPrinter::print_expr_node(const Call_expr &node)
{
    indent();
    print_str("Call");
    bool has_args = !node.arguments.empty();
    print_labeled(has_args, "Callee", node.callee);
    if (has_args)
    {
        with_child(false,
                   [&]
                   {
                       indent();
                       print_str("Arguments");
                       for (size_t i = 0; i < node.arguments.size(); ++i)
                           with_child(i + 1 < node.arguments.size(), [&] { print_expr_ptr(node.arguments[i]); });
                   });
    }
}

void AstPrinter::print_expr_node(const Grouping_expr &node)
{
    indent();
    print_str("Grouping");
    with_child(false, [&] { print_expr_ptr(node.expression); });
}

void AstPrinter::print_expr_node(const Assignment_expr &node)
{
    indent();
    print_str("Assign: " + node.name);
    print_labeled(false, "Value", node.value);
}

// ---------- Statements ----------

void AstPrinter::print_stmt_node(const Expr_stmt &node)
{
    indent();
    print_str("Expr_stmt");
    with_child(false, [&] { print_expr_ptr(node.expression); });
}

void AstPrinter::print_stmt_node(const Print_stmt &node)
{
    indent();
    print_str("Print");
    with_child(false, [&] { print_expr_ptr(node.expression); });
}

void AstPrinter::print_stmt_node(const Var_stmt &node)
{
    indent();
    print_str("Var: " + node.name);
    if (node.initializer)
        print_labeled(false, "Initializer", node.initializer);
}

void AstPrinter::print_stmt_node(const Block_stmt &node)
{
    indent();
    print_str("Block");
    for (size_t i = 0; i < node.statements.size(); ++i)
        with_child(i + 1 < node.statements.size(), [&] { print_stmt_ptr(node.statements[i]); });
}

void AstPrinter::print_stmt_node(const If_stmt &node)
{
    indent();
    print_str("If");
    print_labeled(true, "Cond", node.condition);
    with_child(node.else_branch != nullptr,
               [&]
               {
                   indent();
                   print_str("Then");
                   with_child(false, [&] { print_stmt_ptr(node.then_branch); });
               });
    if (node.else_branch)
    {
        with_child(false,
                   [&]
                   {
                       indent();
                       print_str("Else");
                       with_child(false, [&] { print_stmt_ptr(node.else_branch); });
                   });
    }
}

void AstPrinter::print_stmt_node(const While_stmt &node)
{
    indent();
    print_str("While");
    print_labeled(true, "Cond", node.condition);
    with_child(false,
               [&]
               {
                   indent();
                   print_str("Body");
                   with_child(false, [&] { print_stmt_ptr(node.body); });
               });
}

void AstPrinter::print_stmt_node(const Function_stmt &node)
{
    indent();
    print_str("Function: " + node.name);
    with_child(true,
               [&]
               {
                   indent();
                   print_str("Parameters");
                   for (size_t i = 0; i < node.parameters.size(); ++i)
                   {
                       with_child(i + 1 < node.parameters.size(),
                                  [&]
                                  {
                                      indent();
                                      print_str(node.parameters[i]);
                                  });
                   }
               });
    with_child(false,
               [&]
               {
                   indent();
                   print_str("Body");
                   for (size_t i = 0; i < node.body.size(); ++i)
                       with_child(i + 1 < node.body.size(), [&] { print_stmt_ptr(node.body[i]); });
               });
}

void AstPrinter::print_stmt_node(const Return_stmt &node)
{
    indent();
    print_str("Return");
    if (node.value)
        with_child(false, [&] { print_expr_ptr(node.value); });
}

}  // namespace sable::ast

#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "../parser/ast.hpp"
#include "../value/value.hpp"
#include "../error/result.hpp"
#include "../memory/ref_counted.hpp"
#include "./environment.hpp"

namespace sable
{

// Result of executing one statement: normal completion, or a `return`
// unwinding towards the nearest call with its value.
struct Exec_outcome
{
    Value value;
    bool is_return;
    Exec_outcome() : value(nullptr), is_return(false) {}
    explicit Exec_outcome(const Value &v) : value(v), is_return(true) {}
};

class Interpreter
{
private:
    // Environment management
    mem::rc_ptr<Environment> globals;
    mem::rc_ptr<Environment> environment;

    std::FILE *out_;
    bool echo_ = true;
    size_t call_depth_ = 0;

public:
    // ========================================================================
    // Constructor & Public Interface
    // ========================================================================
    static constexpr size_t MAX_CALL_DEPTH = 512;

    explicit Interpreter(std::FILE *out = stdout);
    ~Interpreter();
    Interpreter(const Interpreter &) = delete;
    Interpreter &operator=(const Interpreter &) = delete;

    // Fresh global frame, then run.
    Result<void> interpret(const std::vector<ast::Stmt*> &statements);
    // Runs against the current globals; bindings persist between calls.
    Result<void> run(const std::vector<ast::Stmt*> &statements);
    void reset_globals();

    // Expression statements print their value unless turned off.
    void set_echo(bool echo) { echo_ = echo; }
    bool echo() const { return echo_; }

    void define_native(const std::string &name, size_t arity, Native_callable code);

    const mem::rc_ptr<Environment> &global_environment() const { return globals; }
    const mem::rc_ptr<Environment> &current_environment() const { return environment; }

private:
    // ========================================================================
    // Expression Evaluation
    // ========================================================================
    Result<Value> evaluate(const ast::Expr &expr);
    Result<Value> evaluate_visitor(const ast::Literal_expr &expr);
    Result<Value> evaluate_visitor(const ast::Variable_expr &expr);
    Result<Value> evaluate_visitor(const ast::Unary_expr &expr);
    Result<Value> evaluate_visitor(const ast::Binary_expr &expr);
    Result<Value> evaluate_visitor(const ast::Logical_expr &expr);
    Result<Value> evaluate_visitor(const ast::Call_expr &expr);
    Result<Value> evaluate_visitor(const ast::Grouping_expr &expr);
    Result<Value> evaluate_visitor(const ast::Assignment_expr &expr);
    // ========================================================================
    // Statement Execution
    // ========================================================================
    Result<Exec_outcome> execute(const ast::Stmt &stmt);

    Result<Exec_outcome> execute_visitor(const ast::Expr_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::Print_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::Var_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::Block_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::If_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::While_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::Function_stmt &stmt);
    Result<Exec_outcome> execute_visitor(const ast::Return_stmt &stmt);

    Result<Exec_outcome> execute_block(const std::vector<ast::Stmt*> &statements, mem::rc_ptr<Environment> block_env);
    // ========================================================================
    // Function Calling
    // ========================================================================
    Result<Value> call(const Value &callee, const std::vector<Value> &arguments, const ast::Source_location &loc);
    Result<Value> call_function(const mem::rc_ptr<Function_value> &function, const std::vector<Value> &arguments);
    // ========================================================================
    // Arithmetic Operations
    // ========================================================================
    Result<Value> add(const Value &l, const Value &r);
    Result<Value> arithmetic(lex::TokenType op, const Value &l, const Value &r);
    Result<Value> compare(lex::TokenType op, const Value &l, const Value &r);
    Result<Value> negate(const Value &v);
};

}  // namespace sable

#include "interpreter.hpp"
#include "./native_globals.hpp"
#include "../error/err.hpp"
#include "../utility/utility.hpp"
#include "../utility/try_res.hpp"

#include <format>
#include <print>
#include <variant>

// RAII guard to restore the environment automatically after scope exits
template <typename F>
struct Finally
{
    F func;
    ~Finally() { func(); }
};

template <typename F>
Finally<F> finally(F func)
{
    return {func};
}

namespace sable
{

Interpreter::Interpreter(std::FILE *out) : out_(out)
{
    reset_globals();
}

// Functions declared at top level hold the global frame as their closure.
Interpreter::~Interpreter()
{
    if (globals != nullptr)
        globals->clear();
}

void Interpreter::reset_globals()
{
    if (globals != nullptr)
        globals->clear();
    globals = mem::make_rc<Environment>();
    environment = globals;
    for (auto &native_fn : native::get_natives()) this->define_native(native_fn->name, native_fn->arity, native_fn->code);
}

Result<void> Interpreter::interpret(const std::vector<ast::Stmt*> &statements)
{
    reset_globals();
    return run(statements);
}

Result<void> Interpreter::run(const std::vector<ast::Stmt*> &statements)
{
    // The parser rejects `return` outside a function, so outcomes here are always normal.
    for (const auto *statement : statements)
        __TryVoid(execute(*statement));
    return {};
}

void Interpreter::define_native(const std::string &name, size_t arity, Native_callable code)
{
    auto func_val = mem::make_rc<Native_function_value>();
    func_val->name = name;
    func_val->arity = arity;
    func_val->code = std::move(code);

    globals->define(name, Value(func_val));
}

// ========================================================================
// Expression Evaluation
// ========================================================================

Result<Value> Interpreter::evaluate(const ast::Expr &expr)
{
    auto result = std::visit([this](auto &&arg) -> Result<Value> {
        return evaluate_visitor(arg);
    }, expr.node);

    // Errors raised below the node (environment, operators, natives) carry no position yet.
    if (!result && result.error().line == 0)
    {
        auto loc = ast::get_loc(expr.node);
        result.error().at(loc.line, loc.column);
    }
    return result;
}

Result<Value> Interpreter::evaluate_visitor(const ast::Literal_expr &expr)
{
    return std::visit(
        [this](const auto &v) -> Result<Value> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, lex::Identifier_name>)
                return environment->get(v.name);
            else
                return Value(v);
        },
        expr.value);
}

Result<Value> Interpreter::evaluate_visitor(const ast::Variable_expr &expr)
{
    return environment->get(expr.name);
}

Result<Value> Interpreter::evaluate_visitor(const ast::Unary_expr &expr)
{
    auto right_result = __Try(evaluate(*expr.right));

    switch (expr.op)
    {
        case lex::TokenType::Minus:
            return negate(right_result);
        case lex::TokenType::Bang:
            return Value(!is_truthy(right_result));
        default:
            return std::unexpected(err::runtime(err::Kind::Unary_operation, "Unknown unary operator",
                                                expr.loc.line, expr.loc.column));
    }
}

Result<Value> Interpreter::evaluate_visitor(const ast::Binary_expr &expr)
{
    auto left_result = __Try(evaluate(*expr.left));
    auto right_result = __Try(evaluate(*expr.right));

    const auto &left = left_result;
    const auto &right = right_result;
    Result<Value> res;
    switch (expr.op)
    {
        case lex::TokenType::Plus:
            res = add(left, right); break;
        case lex::TokenType::Minus:
        case lex::TokenType::Star:
        case lex::TokenType::Slash:
            res = arithmetic(expr.op, left, right); break;
        case lex::TokenType::EqualEqual:
        case lex::TokenType::BangEqual:
        case lex::TokenType::Less:
        case lex::TokenType::LessEqual:
        case lex::TokenType::Greater:
        case lex::TokenType::GreaterEqual:
            res = compare(expr.op, left, right); break;
        default:
            return std::unexpected(err::runtime(err::Kind::Binary_operation,
                                                "Unknown binary operator " + util::operator_token_to_string(expr.op),
                                                expr.loc.line, expr.loc.column));
    }
    if (!res.has_value())
        res.error().at(expr.loc.line, expr.loc.column);
    return res;
}

Result<Value> Interpreter::evaluate_visitor(const ast::Logical_expr &expr)
{
    auto left = __Try(evaluate(*expr.left));

    switch (expr.op)
    {
        case lex::TokenType::Or:
            if (is_truthy(left))
                return left;
            break;
        case lex::TokenType::And:
            if (!is_truthy(left))
                return left;
            break;
        default:
            return std::unexpected(err::runtime(err::Kind::Logical_operator,
                                                "Unknown logical operator " + util::operator_token_to_string(expr.op),
                                                expr.loc.line, expr.loc.column));
    }
    return evaluate(*expr.right);
}

Result<Value> Interpreter::evaluate_visitor(const ast::Call_expr &expr)
{
    auto callee = __Try(evaluate(*expr.callee));

    std::vector<Value> arguments;
    arguments.reserve(expr.arguments.size());
    for (const auto &argument : expr.arguments)
        arguments.push_back(__Try(evaluate(*argument)));

    return call(callee, arguments, expr.loc);
}

Result<Value> Interpreter::evaluate_visitor(const ast::Grouping_expr &expr)
{
    return evaluate(*expr.expression);
}

Result<Value> Interpreter::evaluate_visitor(const ast::Assignment_expr &expr)
{
    auto value_result = __Try(evaluate(*expr.value));
    __TryVoid(environment->assign(expr.name, value_result));

    return value_result;
}

// ========================================================================
// Statement Execution
// ========================================================================

Result<Exec_outcome> Interpreter::execute(const ast::Stmt &stmt)
{
    auto result = std::visit([this](auto &&arg) -> Result<Exec_outcome> {
        return execute_visitor(arg);
    }, stmt.node);

    if (!result && result.error().line == 0)
    {
        auto loc = ast::get_loc(stmt.node);
        result.error().at(loc.line, loc.column);
    }
    return result;
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::Expr_stmt &stmt)
{
    auto value = __Try(evaluate(*stmt.expression));
    if (echo_)
        std::println(out_, "{}", value_to_string(value));
    return Exec_outcome{};
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::Print_stmt &stmt)
{
    auto value = __Try(evaluate(*stmt.expression));
    std::println(out_, "{}", value_to_string(value));
    return Exec_outcome{};
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::Var_stmt &stmt)
{
    std::optional<Value> value;
    if (stmt.initializer != nullptr)
        value = __Try(evaluate(*stmt.initializer));

    environment->define(stmt.name, std::move(value));
    return Exec_outcome{};
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::Block_stmt &stmt)
{
    return execute_block(stmt.statements, mem::make_rc<Environment>(environment));
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::If_stmt &stmt)
{
    auto condition_result = __Try(evaluate(*stmt.condition));

    if (is_truthy(condition_result))
        return execute(*stmt.then_branch);
    else if (stmt.else_branch != nullptr)
        return execute(*stmt.else_branch);

    return Exec_outcome{};
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::While_stmt &stmt)
{
    while (true)
    {
        auto condition_result = __Try(evaluate(*stmt.condition));
        if (!is_truthy(condition_result)) break;

        auto body_result = __Try(execute(*stmt.body));
        if (body_result.is_return) return body_result;
    }
    return Exec_outcome{};
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::Function_stmt &stmt)
{
    auto func_val = mem::make_rc<Function_value>(stmt.name, stmt.parameters, &stmt.body, environment);
    environment->define(stmt.name, Value(func_val));

    return Exec_outcome{};
}

Result<Exec_outcome> Interpreter::execute_visitor(const ast::Return_stmt &stmt)
{
    Value value = nullptr;
    if (stmt.value != nullptr)
        value = __Try(evaluate(*stmt.value));
    return Exec_outcome(value);
}

Result<Exec_outcome> Interpreter::execute_block(const std::vector<ast::Stmt*> &statements, mem::rc_ptr<Environment> block_env)
{
    auto previous = this->environment;
    this->environment = block_env;
    auto guard = finally([this, previous]() { this->environment = previous; });

    for (const auto &statement : statements)
    {
        auto result = execute(*statement);
        if (!result || result.value().is_return)
            return result;
    }
    return Exec_outcome{};
}

// ========================================================================
// Function Calling
// ========================================================================

Result<Value> Interpreter::call(const Value &callee, const std::vector<Value> &arguments, const ast::Source_location &loc)
{
    if (is_function(callee))
    {
        auto func = get_function(callee);
        if (arguments.size() != func->arity())
        {
            return std::unexpected(err::runtime(
                err::Kind::Arity_mismatch,
                std::format("'{}' expected {} arguments but got {}", func->name, func->arity(), arguments.size()),
                loc.line, loc.column));
        }
        return call_function(func, arguments);
    }
    else if (is_native_function(callee))
    {
        auto native_fn = get_native_function(callee);
        if (arguments.size() != native_fn->arity)
        {
            return std::unexpected(err::runtime(
                err::Kind::Arity_mismatch,
                std::format("'{}' expected {} arguments but got {}", native_fn->name, native_fn->arity, arguments.size()),
                loc.line, loc.column));
        }
        return native_fn->code(arguments);
    }

    return std::unexpected(err::runtime(err::Kind::Invalid_call,
                                        std::format("Can only call functions, got {}", get_value_type_string(callee)),
                                        loc.line, loc.column));
}

Result<Value> Interpreter::call_function(const mem::rc_ptr<Function_value> &function, const std::vector<Value> &arguments)
{
    if (call_depth_ >= MAX_CALL_DEPTH)
        return std::unexpected(err::runtime(err::Kind::Stack_overflow,
                                            std::format("Stack overflow: more than {} nested calls", MAX_CALL_DEPTH)));
    call_depth_++;
    auto depth_guard = finally([this]() { call_depth_--; });

    auto new_env = mem::make_rc<Environment>(function->closure);

    for (size_t i = 0; i < function->parameters.size(); ++i)
        new_env->define(function->parameters[i], arguments[i]);

    auto result = __Try(execute_block(*function->body, new_env));
    if (result.is_return) return result.value;

    return Value(nullptr);
}

// ========================================================================
// Arithmetic Operations
// ========================================================================

Result<Value> Interpreter::add(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) + get_number(r));
    if (is_string(l) && is_string(r))
        return Value(get_string(l) + get_string(r));
    return std::unexpected(err::runtime(
        err::Kind::Binary_operation,
        std::format("Operands must be two numbers or two strings for '+': left: {}, right: {}",
                    get_value_type_string(l), get_value_type_string(r))));
}

Result<Value> Interpreter::arithmetic(lex::TokenType op, const Value &l, const Value &r)
{
    if (!is_number(l) || !is_number(r))
    {
        return std::unexpected(err::runtime(
            err::Kind::Binary_operation,
            std::format("Operands must be numbers for '{}': left: {}, right: {}", util::operator_token_to_string(op),
                        get_value_type_string(l), get_value_type_string(r))));
    }

    double a = get_number(l), b = get_number(r);
    switch (op)
    {
        case lex::TokenType::Minus: return Value(a - b);
        case lex::TokenType::Star:  return Value(a * b);
        case lex::TokenType::Slash: return Value(a / b);  // IEEE: x/0 is inf or nan
        default:
            return std::unexpected(err::runtime(err::Kind::Binary_operation,
                                                "Unknown arithmetic operator " + util::operator_token_to_string(op)));
    }
}

Result<Value> Interpreter::compare(lex::TokenType op, const Value &l, const Value &r)
{
    if (!is_number(l) || !is_number(r))
    {
        return std::unexpected(err::runtime(
            err::Kind::Binary_operation,
            std::format("Operands must be numbers for '{}': left: {}, right: {}", util::operator_token_to_string(op),
                        get_value_type_string(l), get_value_type_string(r))));
    }

    double a = get_number(l), b = get_number(r);
    switch (op)
    {
        case lex::TokenType::EqualEqual:   return Value(a == b);
        case lex::TokenType::BangEqual:    return Value(a != b);
        case lex::TokenType::Less:         return Value(a < b);
        case lex::TokenType::LessEqual:    return Value(a <= b);
        case lex::TokenType::Greater:      return Value(a > b);
        case lex::TokenType::GreaterEqual: return Value(a >= b);
        default:
            return std::unexpected(err::runtime(err::Kind::Binary_operation,
                                                "Unknown comparison operator " + util::operator_token_to_string(op)));
    }
}

Result<Value> Interpreter::negate(const Value &v)
{
    if (is_number(v))
        return Value(-get_number(v));
    return std::unexpected(err::runtime(err::Kind::Unary_operation,
                                        std::format("Operand must be a number for unary '-', got {}",
                                                    get_value_type_string(v))));
}

}  // namespace sable

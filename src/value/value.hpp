#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "../error/result.hpp"
#include "../memory/ref_counted.hpp"

namespace sable
{
namespace ast
{
struct Stmt;
}

class Environment;

using Value = std::variant<
    std::nullptr_t,  // nil
    bool,
    double,
    std::string,
    mem::rc_ptr<struct Native_function_value>,
    mem::rc_ptr<struct Function_value>
>;

using Native_callable = std::function<Result<Value>(const std::vector<Value> &arguments)>;

struct Native_function_value
{
    std::string name;
    size_t arity;
    Native_callable code;
};

// A user function keeps the frame it was declared in alive, so nested
// functions see the locals of their enclosing call after it returned.
struct Function_value
{
    std::string name;
    std::vector<std::string> parameters;
    const std::vector<ast::Stmt*> *body;  // owned by the AST arena
    mem::rc_ptr<Environment> closure;

    Function_value(std::string n, std::vector<std::string> params, const std::vector<ast::Stmt*> *b,
                   mem::rc_ptr<Environment> env);
    ~Function_value();

    size_t arity() const { return parameters.size(); }
};

// Helper functions for value manipulation
inline bool is_nil(const Value &value) { return std::holds_alternative<std::nullptr_t>(value); }
inline bool is_bool(const Value &value) { return std::holds_alternative<bool>(value); }
inline bool is_number(const Value &value) { return std::holds_alternative<double>(value); }
inline bool is_string(const Value &value) { return std::holds_alternative<std::string>(value); }
inline bool is_function(const Value &value) { return std::holds_alternative<mem::rc_ptr<Function_value>>(value); }
inline bool is_native_function(const Value &value)
{
    return std::holds_alternative<mem::rc_ptr<Native_function_value>>(value);
}
inline bool is_callable(const Value &value) { return is_function(value) || is_native_function(value); }

inline bool get_bool(const Value &value) { return std::get<bool>(value); }
inline double get_number(const Value &value) { return std::get<double>(value); }
inline const std::string &get_string(const Value &value) { return std::get<std::string>(value); }
inline mem::rc_ptr<Function_value> get_function(const Value &value)
{
    return std::get<mem::rc_ptr<Function_value>>(value);
}
inline mem::rc_ptr<Native_function_value> get_native_function(const Value &value)
{
    return std::get<mem::rc_ptr<Native_function_value>>(value);
}

std::string value_to_string(const Value &value);
std::string get_value_type_string(const Value &value);
bool is_truthy(const Value &value);

}  // namespace sable

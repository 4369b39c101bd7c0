#include "value.hpp"

#include <format>

#include "../interpreter/environment.hpp"

namespace sable
{

Function_value::Function_value(std::string n, std::vector<std::string> params, const std::vector<ast::Stmt*> *b,
                               mem::rc_ptr<Environment> env)
    : name(std::move(n)), parameters(std::move(params)), body(b), closure(std::move(env))
{
}

Function_value::~Function_value() = default;

std::string value_to_string(const Value &value)
{
    if (is_nil(value))
        return "nil";
    if (is_bool(value))
        return get_bool(value) ? "true" : "false";
    if (is_number(value))
        return std::format("{}", get_number(value));  // shortest round-trip form, "3" not "3.000000"
    if (is_string(value))
        return get_string(value);
    if (is_function(value))
        return "<fn " + get_function(value)->name + ">";
    if (is_native_function(value))
        return "<native fn " + get_native_function(value)->name + ">";
    return "<unknown value>";
}

std::string get_value_type_string(const Value &value)
{
    if (is_nil(value))
        return "nil";
    if (is_bool(value))
        return "bool";
    if (is_number(value))
        return "number";
    if (is_string(value))
        return "string";
    if (is_function(value))
        return "function";
    if (is_native_function(value))
        return "native function";
    return "unknown";
}

bool is_truthy(const Value &value)
{
    if (is_bool(value))
        return get_bool(value);
    if (is_number(value))
        return get_number(value) != 0.0;
    if (is_string(value))
        return !get_string(value).empty();
    // nil and callables
    return false;
}

}  // namespace sable

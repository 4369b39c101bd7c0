#pragma once

#include <array>
#include <chrono>
#include <expected>
#include <vector>

#include "../value/value.hpp"
#include "../error/err.hpp"
#include "../memory/ref_counted.hpp"

namespace sable::native
{

// This constexpr value must be updated if you add or remove a native function.
inline constexpr int NUM_NATIVE_FUNCS = 2;

// Returns a fixed-size array of all native function implementations.
inline std::array<mem::rc_ptr<Native_function_value>, NUM_NATIVE_FUNCS> get_natives()
{
    std::array<mem::rc_ptr<Native_function_value>, NUM_NATIVE_FUNCS> functions;

    // === clock ===
    {
        auto func = mem::make_rc<Native_function_value>();
        func->name = "clock";
        func->arity = 0;
        func->code = [](const std::vector<Value> &) -> Result<Value>
        {
            auto time = std::chrono::system_clock::now().time_since_epoch();
            return Value(std::chrono::duration<double>(time).count());
        };

        functions[0] = func;
    }

    // === len ===
    {
        auto func = mem::make_rc<Native_function_value>();
        func->name = "len";
        func->arity = 1;
        func->code = [](const std::vector<Value> &args) -> Result<Value>
        {
            const auto &subject = args[0];
            if (is_string(subject))
                return Value(static_cast<double>(get_string(subject).length()));
            return std::unexpected(err::runtime(err::Kind::Invalid_call,
                                                "len() expects a string, got " + get_value_type_string(subject)));
        };

        functions[1] = func;
    }

    return functions;
}

}  // namespace sable::native

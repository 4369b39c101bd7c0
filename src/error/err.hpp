#ifndef _ERR_HPP_
#define _ERR_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <format>

namespace sable {
namespace err {

enum class Phase : uint8_t { Lexing, Parsing, Runtime };

enum class Kind : uint8_t
{
    None,
    // lexer
    Unexpected_character, Unterminated_string,
    // parser
    Unexpected_token, Expected_expression, Invalid_assignment_target, Too_many_arguments, Return_outside_function,
    // runtime
    Binary_operation, Unary_operation, Variable_not_found, Variable_not_initialized, Logical_operator, Invalid_call,
    Arity_mismatch, Stack_overflow
};

inline std::string phase_to_string(Phase phase)
{
    switch (phase)
    {
        case Phase::Lexing:  return "lexer";
        case Phase::Parsing: return "parser";
        case Phase::Runtime: return "runtime";
    }
    return "unknown";
}

struct msg
{
    std::string message;
    Phase phase = Phase::Runtime;
    Kind kind = Kind::None;
    size_t line = 0;
    size_t column = 0;
    std::string filename = "";

    // Parser diagnostics only: token kind names.
    std::vector<std::string> expected;
    std::string found;

    msg() = default;

    msg(std::string msg, Phase ph, Kind k, size_t l = 0, size_t c = 0)
        : message(std::move(msg)), phase(ph), kind(k), line(l), column(c)
    {
    }

    msg &at(size_t l, size_t c)
    {
        line = l;
        column = c;
        return *this;
    }

    std::string format() const
    {
        std::string where = filename.empty() ? "" : filename + ":";
        std::string detail;
        if (!found.empty())
        {
            std::string wanted;
            for (size_t i = 0; i < expected.size(); ++i)
                wanted += (i == 0 ? "" : " | ") + expected[i];
            detail = wanted.empty() ? std::format(" (found {})", found)
                                    : std::format(" (expected {}, found {})", wanted, found);
        }
        if (line > 0)
            return std::format("{}{}:{}: error: in phase: {} : {}.{}", where, line, column, phase_to_string(phase), message,
                               detail);
        else
            return std::format("{}error: in phase: {}: {}{}", where, phase_to_string(phase), message, detail);
    }
};

inline msg runtime(Kind kind, std::string message, size_t line = 0, size_t column = 0)
{
    return msg(std::move(message), Phase::Runtime, kind, line, column);
}

} // namespace err
} // namespace sable

#endif // _ERR_HPP_

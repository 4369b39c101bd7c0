#pragma once

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <print>
#include <sstream>
#include <string>
#include <vector>

#include "lexer/lexer.hpp"
#include "lexer/token.hpp"
#include "parser/parser.hpp"
#include "parser/ast-printer.hpp"
#include "interpreter/interpreter.hpp"
#include "memory/arena.hpp"

namespace sable {

// Exit statuses of the file runner.
inline constexpr int EXIT_USAGE = 1;
inline constexpr int EXIT_LEX_ERROR = 64;
inline constexpr int EXIT_PARSE_ERROR = 65;
inline constexpr int EXIT_RUNTIME_ERROR = 70;

struct Cli_options
{
    bool dump_tokens = false;
    bool dump_ast = false;
    bool use_unicode = true;
    bool print_only = false;
    bool echo = true;
};

inline void dump_tokens(const std::vector<lex::Token> &tokens)
{
    for (const auto &token : tokens) std::println("{}", lex::token_to_string(token));
}

inline bool read_file(const std::string &filename, std::string &source)
{
    std::ifstream file(filename);
    if (!file.is_open())
        return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    source = buffer.str();
    return true;
}

// Input is complete once every '{' outside string literals and comments is closed.
inline bool is_complete_input(const std::string &input)
{
    int brace_count = 0;
    bool in_string = false;

    for (size_t i = 0; i < input.size(); i++)
    {
        char c = input[i];
        char next = i + 1 < input.size() ? input[i + 1] : '\0';

        if (in_string)
        {
            if (c == '"')
                in_string = false;
            continue;
        }

        if (c == '"')
            in_string = true;
        else if (c == '/' && next == '/')
        {
            // line comment: skip to the newline
            while (i < input.size() && input[i] != '\n') i++;
        }
        else if (c == '/' && next == '*')
        {
            size_t close = input.find("*/", i + 2);
            if (close == std::string::npos)
                break;  // unterminated block comment runs to end of input
            i = close + 1;
        }
        else if (c == '{')
            brace_count++;
        else if (c == '}')
            brace_count--;
    }
    return brace_count <= 0 && !in_string;
}

class Sable_repl
{
private:
    Cli_options options;
    std::FILE *out_;
    Interpreter interpreter;
    // Function values point into the AST, so every arena lives for the session.
    std::vector<std::unique_ptr<mem::Arena>> arenas;

    void print_welcome()
    {
        std::println("Sable REPL");
        std::println("Type 'exit' or 'quit' to exit, 'help' for commands");
        std::println("");
    }

    void print_help()
    {
        std::println("Available commands:");
        std::println("  help          - Show this help message");
        std::println("  exit, quit    - Exit the REPL");
        std::println("  clear         - Clear all defined variables and functions");
        std::println("  :load <file>  - Load and execute a .sable file");
        std::println("");
        std::println("Multi-line input: while a '{{' is left open, input continues on the next line.");
    }

    // Errors are reported and the session goes on.
    void load_file(const std::string &filename)
    {
        std::string source;
        if (!read_file(filename, source))
        {
            std::println(stderr, "Error: Couldn't open file: {}", filename);
            return;
        }

        execute_source(source, filename);
    }

public:
    explicit Sable_repl(Cli_options opts = {}, std::FILE *out = stdout)
        : options(opts), out_(out), interpreter(out)
    {
        interpreter.set_echo(options.echo);
    }

    // Lexes, parses and runs one complete input against the session globals.
    void execute_source(const std::string &source, const std::string &filename = "<repl>")
    {
        lex::Lexer lexer(source);
        auto tokens = lexer.tokenize();
        if (options.dump_tokens)
            dump_tokens(tokens);
        if (lexer.had_error())
        {
            for (auto e : lexer.errors())
            {
                e.filename = filename;
                std::println(stderr, "{}", e.format());
            }
            return;
        }

        auto arena = std::make_unique<mem::Arena>();
        Parser parser(std::move(tokens), *arena, filename);
        auto statements = parser.parse();
        if (parser.had_error())
            return;  // already reported by the parser

        if (options.dump_ast)
            ast::AstPrinter(options.use_unicode, out_).print_statements(statements);
        if (options.print_only)
            return;

        arenas.push_back(std::move(arena));
        auto result = interpreter.run(statements);
        if (!result)
        {
            auto error = result.error();
            error.filename = filename;
            std::println(stderr, "{}", error.format());
        }
    }

    int run()
    {
        print_welcome();

        std::string input;
        std::string line;

        while (true)
        {
            std::print("{}", input.empty() ? "> " : ". ");
            std::fflush(stdout);

            if (!std::getline(std::cin, line))
            {
                // EOF (Ctrl+D): whatever is pending still runs
                std::println("");
                if (!input.empty())
                    execute_source(input);
                break;
            }

            // Handle special commands
            if (input.empty())
            {
                if (line == "exit" || line == "quit")
                    break;
                else if (line == "help")
                {
                    print_help();
                    continue;
                }
                else if (line == "clear")
                {
                    interpreter.reset_globals();
                    arenas.clear();
                    std::println("Cleared all definitions.");
                    continue;
                }
                else if (line.starts_with(":load "))
                {
                    load_file(line.substr(6));
                    continue;
                }
            }

            if (!input.empty())
                input += "\n";
            input += line;

            if (is_complete_input(input))
            {
                execute_source(input);
                input.clear();
            }
        }
        return 0;
    }
};

} // namespace sable

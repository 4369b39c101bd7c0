#include <exception>
#include <print>
#include <string>
#include <vector>

#include "interpreter/interpreter.hpp"
#include "parser/ast-printer.hpp"
#include "parser/parser.hpp"
#include "lexer/lexer.hpp"
#include "lexer/token.hpp"
#include "./memory/arena.hpp"
#include "repl.hpp"

namespace {

void print_usage(const char *program)
{
    std::println(stderr,
                 "Usage: {} [options] [file.sable]\n\n"
                 "Without a file an interactive session is started.\n\n"
                 "Options:\n"
                 "  --tokens        Dump the token stream\n"
                 "  --ast-dump      Dump the parsed AST\n"
                 "  --no-unicode    Disable Unicode tree symbols in AST print\n"
                 "  --print-only    Only print tokens/AST, don't run interpreter\n"
                 "  --quiet         Don't print the value of expression statements\n",
                 program);
}

int run_file(const std::string &filename, const sable::Cli_options &options)
{
    std::string source;
    if (!sable::read_file(filename, source))
    {
        std::println(stderr, "Error: Couldn't open file: {}", filename);
        return sable::EXIT_USAGE;
    }

    sable::lex::Lexer lexer(source);
    auto tokens = lexer.tokenize();
    if (options.dump_tokens)
        sable::dump_tokens(tokens);
    if (lexer.had_error())
    {
        for (auto e : lexer.errors())
        {
            e.filename = filename;
            std::println(stderr, "{}", e.format());
        }
        return sable::EXIT_LEX_ERROR;
    }

    sable::mem::Arena arena;
    sable::Parser parser(std::move(tokens), arena, filename);
    auto statements = parser.parse();
    if (parser.had_error())
        return sable::EXIT_PARSE_ERROR;

    if (options.dump_ast)
        sable::ast::AstPrinter(options.use_unicode).print_statements(statements);
    if (options.print_only)
        return 0;

    sable::Interpreter interpreter;
    interpreter.set_echo(options.echo);
    auto interpret_result = interpreter.interpret(statements);
    if (!interpret_result)
    {
        auto error = interpret_result.error();
        error.filename = filename;
        std::println(stderr, "{}", error.format());
        return sable::EXIT_RUNTIME_ERROR;
    }
    return 0;
}

}  // namespace

int main(int argc, char *argv[])
{
    std::string filename;
    sable::Cli_options options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--tokens")
        {
            options.dump_tokens = true;
        }
        else if (arg == "--ast-dump")
        {
            options.dump_ast = true;
        }
        else if (arg == "--no-unicode")
        {
            options.use_unicode = false;
        }
        else if (arg == "--print-only")
        {
            options.print_only = true;
        }
        else if (arg == "--quiet")
        {
            options.echo = false;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg.starts_with('-'))
        {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage(argv[0]);
            return sable::EXIT_USAGE;
        }
        else
        {
            if (!filename.empty())
            {
                std::println(stderr, "Error: Multiple input files provided: {} and {}", filename, arg);
                return sable::EXIT_USAGE;
            }
            filename = arg;
        }
    }

    try
    {
        if (filename.empty())
            return sable::Sable_repl(options).run();
        return run_file(filename, options);
    }
    catch (const std::exception &e)
    {
        std::println(stderr, "Unexpected error: {}", e.what());
        return sable::EXIT_USAGE;
    }
}

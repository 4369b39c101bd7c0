#include <cassert>
#include <cstdio>
#include <print>
#include <string>
#include <vector>

#include "../src/lexer/lexer.hpp"
#include "../src/parser/parser.hpp"
#include "../src/interpreter/interpreter.hpp"
#include "../src/memory/arena.hpp"

using namespace sable;

// Runs `source` through the whole pipeline and captures what the program prints.
struct Run
{
    std::string output;
    Result<void> result;
};

static Run run(const std::string &source, bool echo = false)
{
    lex::Lexer lexer(source);
    auto tokens = lexer.tokenize();
    assert(!lexer.had_error());

    mem::Arena arena;
    Parser parser(std::move(tokens), arena);
    auto statements = parser.parse();
    assert(!parser.had_error());

    std::FILE *out = std::tmpfile();
    assert(out != nullptr);
    Interpreter interpreter(out);
    interpreter.set_echo(echo);
    auto result = interpreter.interpret(statements);
    // a failed run must leave the interpreter at the global frame
    assert(interpreter.current_environment() == interpreter.global_environment());

    std::rewind(out);
    std::string output;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof buf, out)) > 0) output.append(buf, n);
    std::fclose(out);
    return {output, result};
}

static void expect_output(const std::string &source, const std::string &expected)
{
    auto r = run(source);
    if (!r.result)
        std::println(stderr, "unexpected error: {}", r.result.error().format());
    assert(r.result.has_value());
    if (r.output != expected)
        std::println(stderr, "expected:\n{}got:\n{}", expected, r.output);
    assert(r.output == expected);
}

static err::msg expect_error(const std::string &source, err::Kind kind)
{
    auto r = run(source);
    assert(!r.result.has_value());
    assert(r.result.error().kind == kind);
    assert(r.result.error().phase == err::Phase::Runtime);
    return r.result.error();
}

void test_arithmetic_and_display()
{
    std::println("--- test_arithmetic_and_display ---");
    expect_output("print 1 + 2 * 3;", "7\n");
    expect_output("print (1 + 2) * 3;", "9\n");
    expect_output("print 7 / 2;", "3.5\n");
    expect_output("print -2.25;", "-2.25\n");
    expect_output("print 1 / 0;", "inf\n");
    expect_output("print \"foo\" + \"bar\";", "foobar\n");
    expect_output("print nil; print true; print !nil;", "nil\ntrue\ntrue\n");
}

void test_comparisons()
{
    std::println("--- test_comparisons ---");
    expect_output("print 1 < 2; print 2 <= 1; print 3 == 3; print 3 != 3;", "true\nfalse\ntrue\nfalse\n");
    expect_error("print \"a\" == \"a\";", err::Kind::Binary_operation);
    expect_error("print 1 < \"2\";", err::Kind::Binary_operation);
}

void test_operand_errors()
{
    std::println("--- test_operand_errors ---");
    auto e = expect_error("print 1 + \"a\";", err::Kind::Binary_operation);
    assert(e.line == 1 && e.column == 9);
    expect_error("print -\"a\";", err::Kind::Unary_operation);
    expect_error("print nil * 2;", err::Kind::Binary_operation);
}

void test_truthiness()
{
    std::println("--- test_truthiness ---");
    expect_output("if (0) print \"y\"; else print \"n\";", "n\n");
    expect_output("if (\"\") print \"y\"; else print \"n\";", "n\n");
    expect_output("if (\"x\") print \"y\"; else print \"n\";", "y\n");
    expect_output("fun f() {} if (f) print \"y\"; else print \"n\";", "n\n");
}

void test_logical_short_circuit()
{
    std::println("--- test_logical_short_circuit ---");
    expect_output("print nil or \"fallback\";", "fallback\n");
    expect_output("print 0 and undefined_name;", "0\n");
    expect_output("print 1 or undefined_name;", "1\n");
    expect_output("print 1 and 2;", "2\n");
}

void test_variables_and_scopes()
{
    std::println("--- test_variables_and_scopes ---");
    expect_output("var a = 1; { var a = 2; print a; } print a;", "2\n1\n");
    expect_output("var a = 1; { a = 3; } print a;", "3\n");
    expect_output("var a; a = \"set\"; print a;", "set\n");
    expect_output("var a = 1; var a = 2; print a;", "2\n");

    auto missing = expect_error("print nope;", err::Kind::Variable_not_found);
    assert(missing.line == 1 && missing.column == 7);
    expect_error("var a; print a;", err::Kind::Variable_not_initialized);
    expect_error("nope = 1;", err::Kind::Variable_not_found);
}

void test_loops()
{
    std::println("--- test_loops ---");
    expect_output("var i = 0; while (i < 3) { print i; i = i + 1; }", "0\n1\n2\n");
    expect_output("for (var i = 0; i < 3; i = i + 1) print i * 10;", "0\n10\n20\n");
    // the loop variable lives in the desugared outer block
    expect_error("for (var i = 0; i < 1; i = i + 1) {} print i;", err::Kind::Variable_not_found);
}

void test_functions_and_return()
{
    std::println("--- test_functions_and_return ---");
    expect_output("fun add(a, b) { return a + b; } print add(2, 3);", "5\n");
    expect_output("fun nothing() {} print nothing();", "nil\n");
    expect_output("fun early(n) { while (true) { if (n > 2) return n; n = n + 1; } } print early(0);", "3\n");
    expect_output("fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); } print fib(15);", "610\n");
    expect_output("fun f() {} print f; print clock;", "<fn f>\n<native fn clock>\n");
}

void test_closures()
{
    std::println("--- test_closures ---");
    expect_output("fun make_counter() {\n"
                  "  var count = 0;\n"
                  "  fun inc() { count = count + 1; return count; }\n"
                  "  return inc;\n"
                  "}\n"
                  "var a = make_counter();\n"
                  "var b = make_counter();\n"
                  "print a(); print a(); print b();",
                  "1\n2\n1\n");
}

void test_call_errors()
{
    std::println("--- test_call_errors ---");
    auto arity = expect_error("fun f(a) {} f(1, 2);", err::Kind::Arity_mismatch);
    assert(arity.message == "'f' expected 1 arguments but got 2");
    assert(arity.column == 19);
    expect_error("var x = 1; x();", err::Kind::Invalid_call);
    expect_error("len(1, 2);", err::Kind::Arity_mismatch);
    expect_error("len(1);", err::Kind::Invalid_call);
}

void test_natives()
{
    std::println("--- test_natives ---");
    expect_output("print len(\"hello\");", "5\n");
    expect_output("print clock() > 0;", "true\n");
}

void test_error_inside_block_restores_frame()
{
    std::println("--- test_error_inside_block_restores_frame ---");
    // run() asserts the interpreter is back at the global frame
    expect_error("{ var a = 1; { print a + nil; } }", err::Kind::Binary_operation);
    expect_error("fun f() { { return nope; } } f();", err::Kind::Variable_not_found);
    expect_error("while (nope) {}", err::Kind::Variable_not_found);
}

void test_echo()
{
    std::println("--- test_echo ---");
    assert(Interpreter().echo());

    auto r = run("1 + 1; var x = 3; x; { 5; } fun f() { 6; } f(); x = 4; print x;", true);
    assert(r.result.has_value());
    // blocks and function bodies echo too; a call without return echoes nil
    assert(r.output == "2\n3\n5\n6\nnil\n4\n4\n");

    auto loop = run("for (var i = 0; i < 2; i = i + 1) {}", true);
    assert(loop.result.has_value());
    assert(loop.output == "1\n2\n");
}

static std::vector<ast::Stmt*> parse_into(mem::Arena &arena, const std::string &source)
{
    lex::Lexer lexer(source);
    Parser parser(lexer.tokenize(), arena);
    auto statements = parser.parse();
    assert(!parser.had_error());
    return statements;
}

void test_deep_recursion()
{
    std::println("--- test_deep_recursion ---");
    const std::string down = "fun down(n) { if (n == 0) return 0; return down(n - 1); }";
    expect_output(down + " print down(300);", "0\n");

    auto e = expect_error(down + " print down(100000);", err::Kind::Stack_overflow);
    assert(e.line == 1);

    // the depth count unwinds with the error
    std::FILE *out = std::tmpfile();
    assert(out != nullptr);
    Interpreter interpreter(out);
    mem::Arena arena;
    assert(!interpreter.run(parse_into(arena, down + " down(5000);")).has_value());
    assert(interpreter.run(parse_into(arena, "print down(300);")).has_value());
    std::fclose(out);
}

void test_reset_releases_globals()
{
    std::println("--- test_reset_releases_globals ---");
    std::FILE *out = std::tmpfile();
    assert(out != nullptr);
    Interpreter interpreter(out);
    mem::Arena arena;
    assert(interpreter.run(parse_into(arena, "fun f() { return 1; } var g = f;")).has_value());

    auto old_globals = interpreter.global_environment();
    assert(old_globals.use_count() > 2);
    interpreter.reset_globals();
    // f held the old frame as its closure; clearing the frame breaks the cycle
    assert(old_globals.use_count() == 1);
    assert(!old_globals->contains("f"));
    assert(interpreter.global_environment()->contains("clock"));
    std::fclose(out);
}

void test_globals_persist_across_runs()
{
    std::println("--- test_globals_persist_across_runs ---");
    std::FILE *out = std::tmpfile();
    assert(out != nullptr);
    Interpreter interpreter(out);
    std::vector<mem::Arena> arenas;
    arenas.reserve(3);

    auto parse = [&](const std::string &source) {
        lex::Lexer lexer(source);
        arenas.emplace_back();
        Parser parser(lexer.tokenize(), arenas.back());
        return parser.parse();
    };

    assert(interpreter.run(parse("var n = 41; fun inc(x) { return x + 1; }")).has_value());
    assert(interpreter.run(parse("print inc(n);")).has_value());
    interpreter.reset_globals();
    assert(!interpreter.run(parse("print n;")).has_value());

    std::rewind(out);
    char buf[64] = {};
    size_t n = std::fread(buf, 1, sizeof buf - 1, out);
    std::fclose(out);
    assert(std::string(buf, n) == "42\n");
}

int main()
{
    test_arithmetic_and_display();
    test_comparisons();
    test_operand_errors();
    test_truthiness();
    test_logical_short_circuit();
    test_variables_and_scopes();
    test_loops();
    test_functions_and_return();
    test_closures();
    test_call_errors();
    test_natives();
    test_error_inside_block_restores_frame();
    test_echo();
    test_deep_recursion();
    test_reset_releases_globals();
    test_globals_persist_across_runs();

    std::println("All interpreter tests passed!");
}

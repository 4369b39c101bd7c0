#include <cassert>
#include <print>
#include <string>

#include "../src/interpreter/environment.hpp"
#include "../src/memory/ref_counted.hpp"

using namespace sable;

void test_define_and_get()
{
    std::println("--- test_define_and_get ---");
    Environment env;
    env.define("a", Value(1.0));
    auto value = env.get("a");
    assert(value.has_value());
    assert(get_number(*value) == 1.0);
    assert(env.contains("a"));
    assert(!env.contains("b"));
}

void test_redefine_overwrites()
{
    std::println("--- test_redefine_overwrites ---");
    Environment env;
    env.define("a", Value(1.0));
    env.define("a", Value(std::string("two")));
    assert(get_string(*env.get("a")) == "two");
}

void test_uninitialized_vs_missing()
{
    std::println("--- test_uninitialized_vs_missing ---");
    Environment env;
    env.define("x", std::nullopt);

    auto uninit = env.get("x");
    assert(!uninit.has_value());
    assert(uninit.error().kind == err::Kind::Variable_not_initialized);

    auto missing = env.get("y");
    assert(!missing.has_value());
    assert(missing.error().kind == err::Kind::Variable_not_found);
    assert(missing.error().phase == err::Phase::Runtime);

    // Assignment initializes a declared binding.
    assert(env.assign("x", Value(true)).has_value());
    assert(get_bool(*env.get("x")) == true);
}

void test_lookup_walks_outward()
{
    std::println("--- test_lookup_walks_outward ---");
    auto global = mem::make_rc<Environment>();
    global->define("g", Value(1.0));
    auto middle = mem::make_rc<Environment>(global);
    auto inner = mem::make_rc<Environment>(middle);

    assert(get_number(*inner->get("g")) == 1.0);
    assert(inner->enclosing() == middle);
    assert(global->enclosing() == nullptr);

    // shadowing in the inner frame leaves the outer binding alone
    inner->define("g", Value(2.0));
    assert(get_number(*inner->get("g")) == 2.0);
    assert(get_number(*global->get("g")) == 1.0);
}

void test_assign_targets_nearest_binding()
{
    std::println("--- test_assign_targets_nearest_binding ---");
    auto global = mem::make_rc<Environment>();
    global->define("a", Value(1.0));
    auto inner = mem::make_rc<Environment>(global);

    assert(inner->assign("a", Value(5.0)).has_value());
    assert(!inner->contains("a"));
    assert(get_number(*global->get("a")) == 5.0);

    auto missing = inner->assign("nope", Value(nullptr));
    assert(!missing.has_value());
    assert(missing.error().kind == err::Kind::Variable_not_found);
    // failed assignment creates no binding anywhere
    assert(!inner->contains("nope"));
    assert(!global->contains("nope"));
}

void test_frames_outlive_their_scope()
{
    std::println("--- test_frames_outlive_their_scope ---");
    mem::rc_ptr<Environment> kept;
    {
        auto global = mem::make_rc<Environment>();
        global->define("v", Value(std::string("alive")));
        kept = mem::make_rc<Environment>(global);
    }
    assert(get_string(*kept->get("v")) == "alive");
}

int main()
{
    test_define_and_get();
    test_redefine_overwrites();
    test_uninitialized_vs_missing();
    test_lookup_walks_outward();
    test_assign_targets_nearest_binding();
    test_frames_outlive_their_scope();

    std::println("All environment tests passed!");
}

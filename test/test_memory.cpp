#include <cassert>
#include <cstdint>
#include <print>
#include <string>
#include <vector>

#include "../src/memory/arena.hpp"
#include "../src/memory/ref_counted.hpp"

struct Tracker
{
    static inline int live_count = 0;
    int id;

    Tracker(int id) : id(id) { ++live_count; }
    ~Tracker() { --live_count; }
};

// Destruction order is recorded here by Ordered's destructor.
static std::vector<int> destroyed;

struct Ordered
{
    int id;
    std::string payload;
    ~Ordered() { destroyed.push_back(id); }
};

// ------------------------------
// rc_ptr
// ------------------------------

void test_basic_construction()
{
    std::println("--- test_basic_construction ---");
    {
        sable::mem::rc_ptr<Tracker> a = sable::mem::make_rc<Tracker>(1);
        assert(a.use_count() == 1);
        assert(Tracker::live_count == 1);
        assert(a->id == 1);
    }
    assert(Tracker::live_count == 0);
}

void test_copy_semantics()
{
    std::println("--- test_copy_semantics ---");
    {
        sable::mem::rc_ptr<Tracker> a = sable::mem::make_rc<Tracker>(2);
        sable::mem::rc_ptr<Tracker> b = a;
        sable::mem::rc_ptr<Tracker> c(a);
        assert(a.use_count() == 3);
        assert(b == c);
        assert(Tracker::live_count == 1);
    }
    assert(Tracker::live_count == 0);
}

void test_move_semantics()
{
    std::println("--- test_move_semantics ---");
    {
        sable::mem::rc_ptr<Tracker> a = sable::mem::make_rc<Tracker>(3);
        sable::mem::rc_ptr<Tracker> b = std::move(a);
        assert(!a);
        assert(b.use_count() == 1);

        sable::mem::rc_ptr<Tracker> c;
        c = std::move(b);
        assert(!b);
        assert(c.use_count() == 1);
        assert(Tracker::live_count == 1);
    }
    assert(Tracker::live_count == 0);
}

void test_assignment()
{
    std::println("--- test_assignment ---");
    {
        sable::mem::rc_ptr<Tracker> a = sable::mem::make_rc<Tracker>(4);
        sable::mem::rc_ptr<Tracker> b = sable::mem::make_rc<Tracker>(5);
        assert(Tracker::live_count == 2);

        b = a;
        assert(a.use_count() == 2);
        assert(Tracker::live_count == 1);  // Tracker(5) destroyed

        b = b;
        assert(a.use_count() == 2);
    }
    assert(Tracker::live_count == 0);
}

void test_reset()
{
    std::println("--- test_reset ---");
    sable::mem::rc_ptr<Tracker> a = sable::mem::make_rc<Tracker>(6);
    sable::mem::rc_ptr<Tracker> b = a;
    a.reset();
    assert(!a);
    assert(a == nullptr);
    assert(b.use_count() == 1);
    assert(Tracker::live_count == 1);
    b.reset();
    assert(Tracker::live_count == 0);
}

void test_null_rc()
{
    std::println("--- test_null_rc ---");
    sable::mem::rc_ptr<Tracker> a;
    assert(!a);
    assert(a.use_count() == 0);

    sable::mem::rc_ptr<Tracker> b = a;
    assert(!b);
    assert(b.use_count() == 0);

    sable::mem::rc_ptr<Tracker> c = nullptr;
    assert(c == nullptr);
}

// ------------------------------
// Arena
// ------------------------------

void test_arena_alignment()
{
    std::println("--- test_arena_alignment ---");
    sable::mem::Arena arena;
    for (int i = 0; i < 100; ++i)
    {
        auto *c = arena.create<char>('x');
        auto *d = arena.create<double>(1.5);
        auto *p = arena.create<std::uint64_t>(7u);
        assert(*c == 'x');
        assert(reinterpret_cast<std::uintptr_t>(d) % alignof(double) == 0);
        assert(reinterpret_cast<std::uintptr_t>(p) % alignof(std::uint64_t) == 0);
    }
    // Trivially destructible objects need no destructor entries.
    assert(arena.object_count() == 0);
}

void test_arena_destructors()
{
    std::println("--- test_arena_destructors ---");
    destroyed.clear();
    {
        sable::mem::Arena arena;
        for (int i = 0; i < 3; ++i)
            sable::mem::Arena::alloc(arena, Ordered{i, std::string(64, 'a')});
        // the temporaries passed to alloc() are gone already
        destroyed.clear();
        assert(arena.object_count() == 3);
    }
    assert((destroyed == std::vector<int>{2, 1, 0}));
}

void test_arena_large_and_reset()
{
    std::println("--- test_arena_large_and_reset ---");
    sable::mem::Arena arena;
    auto *big = arena.allocate<int>(10000);  // larger than one block
    for (int i = 0; i < 10000; ++i) big[i] = i;
    assert(big[9999] == 9999);

    destroyed.clear();
    arena.create<Ordered>(Ordered{42, "x"});
    destroyed.clear();
    arena.reset();
    assert((destroyed == std::vector<int>{42}));
    assert(arena.object_count() == 0);

    auto *after = arena.create<int>(5);
    assert(*after == 5);
}

int main()
{
    test_basic_construction();
    test_copy_semantics();
    test_move_semantics();
    test_assignment();
    test_reset();
    test_null_rc();

    test_arena_alignment();
    test_arena_destructors();
    test_arena_large_and_reset();

    std::println("All memory tests passed!");
}

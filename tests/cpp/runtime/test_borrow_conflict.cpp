/**
 * @file test_borrow_conflict.cpp
 * @brief Tests for re-entrant access that the runtime reports as BorrowConflictError.
 */

#include <catch2/catch_test_macros.hpp>
#include <reflow/reflow.h>

#include <memory>

using namespace reflow;

// ============================================================================
// Value cell borrows through handles
// ============================================================================

TEST_CASE("BorrowConflict - setting a signal while reading it", "[borrow]") {
    Runtime rt;
    auto s = create_rw_signal(rt, 1);
    CHECK_THROWS_AS(s.with([&](const int &) { s.set(2); }), BorrowConflictError);
    CHECK(s.get_untracked() == 1);
}

TEST_CASE("BorrowConflict - reading a signal from inside its own update", "[borrow]") {
    Runtime rt;
    auto s = create_rw_signal(rt, 1);
    CHECK_THROWS_AS(s.update([&](int &v) { v = s.get_untracked() + 1; }), BorrowConflictError);
    CHECK(s.get_untracked() == 1);

    // The failed borrows were released
    s.update([](int &v) { v += 1; });
    CHECK(s.get_untracked() == 2);
}

TEST_CASE("BorrowConflict - nested reads are allowed", "[borrow]") {
    Runtime rt;
    auto s = create_rw_signal(rt, 3);
    auto product = s.with([&](const int &outer) { return s.with([&](const int &inner) { return outer * inner; }); });
    CHECK(product == 9);
}

// ============================================================================
// Memo computations
// ============================================================================

TEST_CASE("BorrowConflict - a memo writing a signal it read", "[borrow][memo]") {
    Runtime rt;
    auto a = create_rw_signal(rt, 1);
    auto bumped = create_memo(rt, [a] {
        auto v = a.get();
        a.set(v + 1);
        return v;
    });

    CHECK_THROWS_AS(bumped.get(), BorrowConflictError);
    CHECK(a.get_untracked() == 1);
    CHECK_FALSE(rt.engine().is_draining());
}

TEST_CASE("BorrowConflict - a memo reading itself", "[borrow][memo]") {
    Runtime rt;
    auto self = std::make_shared<Memo<int>>();
    *self = create_memo(rt, [self] { return self->get() + 1; });

    CHECK_THROWS_AS(self->get(), BorrowConflictError);

    // The failed run released its running flag, the next read conflicts again rather than looping
    CHECK_THROWS_AS(self->get(), BorrowConflictError);
    self->dispose();
}

TEST_CASE("BorrowConflict - a memo reading itself through another memo", "[borrow][memo]") {
    Runtime rt;
    auto first = std::make_shared<Memo<int>>();
    auto second = create_memo(rt, [first] { return first->get() * 2; });
    *first = create_memo(rt, [second] { return second.get() + 1; });

    CHECK_THROWS_AS(first->get(), BorrowConflictError);
    first->dispose();
}

TEST_CASE("BorrowConflict - a memo may write a signal it has not read", "[borrow][memo]") {
    Runtime rt;
    auto a = create_rw_signal(rt, 4);
    auto mirror = create_rw_signal(rt, 0);
    auto squared = create_memo(rt, [a, mirror] {
        auto v = a.get();
        mirror.set(v);
        return v * v;
    });

    CHECK_NOTHROW(squared.get());
    CHECK(squared.get() == 16);
    CHECK(mirror.get_untracked() == 4);
}

TEST_CASE("BorrowConflict - an effect may write a signal it read", "[borrow][effect]") {
    Runtime rt;
    auto a = create_rw_signal(rt, 1);
    CHECK_NOTHROW(create_effect(rt, [a] {
        if (a.get() < 3) { a.update([](int &v) { v += 1; }); }
    }));
    CHECK(a.get_untracked() == 2);
}

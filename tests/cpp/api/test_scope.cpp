/**
 * @file test_scope.cpp
 * @brief Tests for scopes: ownership and disposal of nodes, cleanups, nesting and context lookup.
 */

#include <catch2/catch_test_macros.hpp>
#include <reflow/reflow.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reflow;

namespace {

struct Theme {
    std::string name;
};

struct FailingDisposeObserver : RuntimeObserver {
    void on_node_disposed(const NodeInfo &) override { throw std::logic_error("observer failed"); }
};

}  // namespace

// ============================================================================
// Ownership and disposal
// ============================================================================

TEST_CASE("Scope - nodes created in a scope are disposed with it", "[api][scope]") {
    Runtime rt;
    auto scope = create_scope(rt);
    auto s = scope.run([&] { return create_rw_signal(rt, 1); });
    auto doubled = scope.run([&] { return create_memo(rt, [s] { return s.get() * 2; }); });
    CHECK(doubled.get() == 2);

    scope.dispose();

    CHECK(scope.is_disposed());
    CHECK(s.is_disposed());
    CHECK(doubled.is_disposed());
    CHECK_THROWS_AS(s.get(), DisposedError);
    CHECK_THROWS_AS(s.set(2), DisposedError);
    CHECK_THROWS_AS(doubled.get(), DisposedError);
    CHECK(rt.node_count() == 0);
}

TEST_CASE("Scope - effects in a disposed scope stop running", "[api][scope]") {
    Runtime rt;
    auto runs = std::make_shared<int>(0);
    auto source = create_rw_signal(rt, 0);
    auto scope = create_scope(rt);
    scope.run([&] {
        create_effect(rt, [source, runs] {
            (void) source.get();
            ++*runs;
        });
    });

    source.set(1);
    CHECK(*runs == 2);

    scope.dispose();
    source.set(2);
    CHECK(*runs == 2);
    CHECK(rt.subscribers_of(source.id()).empty());
    CHECK_FALSE(source.is_disposed());
}

TEST_CASE("Scope - disposing twice is harmless", "[api][scope]") {
    Runtime rt;
    auto scope = create_scope(rt);
    scope.dispose();
    CHECK_NOTHROW(scope.dispose());
    CHECK_THROWS_AS(scope.run([] {}), DisposedError);
    CHECK_THROWS_AS(scope.on_cleanup([] {}), DisposedError);
}

TEST_CASE("Scope - children are disposed before the parent's cleanups run", "[api][scope]") {
    Runtime rt;
    auto order = std::make_shared<std::vector<std::string>>();
    auto parent = create_scope(rt);
    auto child = parent.child();
    auto grandchild = child.child();

    parent.on_cleanup([order] { order->push_back("parent-1"); });
    child.on_cleanup([order] { order->push_back("child"); });
    grandchild.on_cleanup([order] { order->push_back("grandchild"); });
    parent.on_cleanup([order] { order->push_back("parent-2"); });

    parent.dispose();

    CHECK(*order == std::vector<std::string>{"grandchild", "child", "parent-1", "parent-2"});
    CHECK(child.is_disposed());
    CHECK(grandchild.is_disposed());
    CHECK(rt.scope_count() == 1);
}

TEST_CASE("Scope - cleanups run before owned nodes are disposed", "[api][scope]") {
    Runtime rt;
    auto last_value = std::make_shared<int>(0);
    run_scope(rt, [&](Scope) {
        auto s = create_rw_signal(rt, 42);
        on_cleanup(rt, [s, last_value] { *last_value = s.get_untracked(); });
    });
    CHECK(*last_value == 42);
}

TEST_CASE("Scope - a throwing cleanup still disposes the owned nodes", "[api][scope]") {
    Runtime rt;
    auto scope = create_scope(rt);
    auto s = scope.run([&] { return create_rw_signal(rt, 1); });
    scope.on_cleanup([] { throw std::runtime_error("cleanup failed"); });

    CHECK_THROWS_AS(scope.dispose(), std::runtime_error);
    CHECK(scope.is_disposed());
    CHECK(s.is_disposed());
}

TEST_CASE("Scope - an observer raising after a failed cleanup reports its own error", "[api][scope]") {
    Runtime rt;
    auto observer = std::make_shared<FailingDisposeObserver>();
    auto scope = create_scope(rt);
    auto s = scope.run([&] { return create_rw_signal(rt, 1); });
    scope.on_cleanup([] { throw std::runtime_error("cleanup failed"); });
    rt.add_observer(observer);

    CHECK_THROWS_AS(scope.dispose(), std::logic_error);
    rt.remove_observer(observer);
    CHECK(scope.is_disposed());
}

TEST_CASE("Scope - run_scope reports a cleanup that raises", "[api][scope]") {
    Runtime rt;
    CHECK_THROWS_AS(run_scope(rt,
                              [](Scope scope) {
                                  scope.on_cleanup([] { throw std::runtime_error("cleanup failed"); });
                                  return 1;
                              }),
                    std::runtime_error);
    CHECK(rt.current_scope() == rt.root_scope());
}

TEST_CASE("Scope - run_scope disposes the scope when the closure raises", "[api][scope]") {
    Runtime rt;
    auto captured = std::make_shared<Scope>();
    CHECK_THROWS_AS(run_scope(rt,
                              [&](Scope scope) {
                                  *captured = scope;
                                  create_trigger(rt);
                                  throw std::runtime_error("abort");
                              }),
                    std::runtime_error);
    CHECK(captured->is_disposed());
    CHECK(rt.node_count() == 0);
    CHECK(rt.current_scope() == rt.root_scope());
}

TEST_CASE("Scope - run_scope returns the closure's value", "[api][scope]") {
    Runtime rt;
    auto value = run_scope(rt, [](Scope scope) { return scope.parent().has_value(); });
    CHECK(value);
}

TEST_CASE("Scope - parent and current scope", "[api][scope]") {
    Runtime rt;
    auto root = current_scope(rt);
    CHECK_FALSE(root.parent().has_value());

    auto child = create_scope(rt);
    REQUIRE(child.parent().has_value());
    CHECK(*child.parent() == root);

    child.run([&] {
        CHECK(current_scope(rt) == child);
        auto nested = create_scope(rt);
        CHECK(*nested.parent() == child);
    });
    CHECK(current_scope(rt) == root);
}

TEST_CASE("Scope - computations run in the scope that created them", "[api][scope]") {
    Runtime rt;
    auto created = std::make_shared<std::vector<RwSignal<int>>>();
    auto trigger = create_rw_signal(rt, 0);
    auto scope = create_scope(rt);
    scope.run([&] {
        create_effect(rt, [&rt, trigger, created] {
            created->push_back(create_rw_signal(rt, trigger.get()));
        });
    });

    // Re-run from outside the scope, the new node still belongs to it
    trigger.set(1);
    REQUIRE(created->size() == 2);

    scope.dispose();
    for (const auto &signal : *created) { CHECK(signal.is_disposed()); }
}

TEST_CASE("Scope - the runtime destructor runs every cleanup", "[api][scope]") {
    auto order = std::make_shared<std::vector<std::string>>();
    {
        Runtime rt;
        on_cleanup(rt, [order] { order->push_back("root"); });
        auto child = create_scope(rt);
        child.on_cleanup([order] { order->push_back("child"); });
    }
    CHECK(*order == std::vector<std::string>{"child", "root"});
}

// ============================================================================
// Context
// ============================================================================

TEST_CASE("Context - values are visible to descendant scopes", "[api][scope][context]") {
    Runtime rt;
    provide_context(rt, Theme{"dark"});
    auto child = create_scope(rt);
    auto name = child.child().run([&] { return use_context<Theme>(rt).name; });
    CHECK(name == "dark");
}

TEST_CASE("Context - the nearest provider wins", "[api][scope][context]") {
    Runtime rt;
    provide_context(rt, Theme{"dark"});
    auto child = create_scope(rt);
    child.run([&] {
        provide_context(rt, Theme{"light"});
        CHECK(use_context<Theme>(rt).name == "light");
    });
    CHECK(use_context<Theme>(rt).name == "dark");

    // Providing again in the same scope replaces the value
    provide_context(rt, Theme{"contrast"});
    CHECK(use_context<Theme>(rt).name == "contrast");
}

TEST_CASE("Context - missing context", "[api][scope][context]") {
    Runtime rt;
    CHECK_FALSE(try_use_context<Theme>(rt).has_value());
    CHECK_THROWS_AS(use_context<Theme>(rt), MissingContextError);
}

TEST_CASE("Context - context provided by a disposed scope is gone", "[api][scope][context]") {
    Runtime rt;
    auto child = create_scope(rt);
    child.run([&] { provide_context(rt, 7); });
    CHECK(child.run([&] { return use_context<int>(rt); }) == 7);
    child.dispose();
    CHECK_FALSE(try_use_context<int>(rt).has_value());
}

TEST_CASE("Context - computations see the context of their scope", "[api][scope][context]") {
    Runtime rt;
    auto seen = std::make_shared<std::vector<std::string>>();
    auto tick = create_trigger(rt);
    auto scope = create_scope(rt);
    scope.run([&] {
        provide_context(rt, Theme{"scoped"});
        create_effect(rt, [&rt, tick, seen] {
            tick.track();
            seen->push_back(use_context<Theme>(rt).name);
        });
    });

    tick.notify();
    CHECK(*seen == std::vector<std::string>{"scoped", "scoped"});
}

/**
 * @file test_dependency_tracker.cpp
 * @brief Unit tests for the observer stack that records dependencies on read.
 */

#include <catch2/catch_test_macros.hpp>
#include <reflow/runtime/dependency_tracker.h>
#include <reflow/runtime/node_arena.h>

#include <stdexcept>
#include <vector>

using namespace reflow;

namespace {

struct TrackerFixture {
    NodeArena arena;
    DependencyTracker tracker{arena};

    NodeId make_node(NodeKind kind) {
        return arena.allocate(ReactiveNode{kind, NodeState::CLEAN, std::make_shared<ValueCell>(), nullptr, ScopeId{}});
    }
};

}  // namespace

TEST_CASE("DependencyTracker - reads outside an observer are not recorded", "[tracker]") {
    TrackerFixture f;
    auto source = f.make_node(NodeKind::SIGNAL);
    CHECK_FALSE(f.tracker.is_tracking());
    f.tracker.track_read(source);
    CHECK(f.arena.subscribers_of(source).empty());
}

TEST_CASE("DependencyTracker - reads inside an observer create edges", "[tracker]") {
    TrackerFixture f;
    auto source = f.make_node(NodeKind::SIGNAL);
    auto memo = f.make_node(NodeKind::MEMO);

    auto result = f.tracker.with_observer(memo, [&] {
        CHECK(f.tracker.current_observer() == memo);
        f.tracker.track_read(source);
        return 7;
    });

    CHECK(result == 7);
    CHECK(f.arena.sources_of(memo) == std::vector<NodeId>{source});
    CHECK(f.tracker.depth() == 0);
}

TEST_CASE("DependencyTracker - nested observers restore the outer one", "[tracker]") {
    TrackerFixture f;
    auto source = f.make_node(NodeKind::SIGNAL);
    auto outer = f.make_node(NodeKind::EFFECT);
    auto inner = f.make_node(NodeKind::MEMO);

    f.tracker.with_observer(outer, [&] {
        f.tracker.with_observer(inner, [&] { f.tracker.track_read(source); });
        CHECK(f.tracker.current_observer() == outer);
        f.tracker.track_read(inner);
    });

    CHECK(f.arena.sources_of(inner) == std::vector<NodeId>{source});
    CHECK(f.arena.sources_of(outer) == std::vector<NodeId>{inner});
}

TEST_CASE("DependencyTracker - untracked sections record nothing", "[tracker]") {
    TrackerFixture f;
    auto source = f.make_node(NodeKind::SIGNAL);
    auto effect = f.make_node(NodeKind::EFFECT);

    f.tracker.with_observer(effect, [&] {
        f.tracker.untracked([&] {
            CHECK_FALSE(f.tracker.is_tracking());
            f.tracker.track_read(source);
        });
        CHECK(f.tracker.is_tracking());
    });

    CHECK(f.arena.sources_of(effect).empty());
}

TEST_CASE("DependencyTracker - the stack is restored when the observer throws", "[tracker]") {
    TrackerFixture f;
    auto effect = f.make_node(NodeKind::EFFECT);

    CHECK_THROWS_AS(f.tracker.with_observer(effect, [] { throw std::runtime_error("fail"); }), std::runtime_error);
    CHECK(f.tracker.depth() == 0);
    CHECK_FALSE(f.tracker.current_observer().has_value());
}

TEST_CASE("DependencyTracker - a node reading itself is not linked", "[tracker]") {
    TrackerFixture f;
    auto memo = f.make_node(NodeKind::MEMO);
    f.tracker.with_observer(memo, [&] { f.tracker.track_read(memo); });
    CHECK(f.arena.sources_of(memo).empty());
}

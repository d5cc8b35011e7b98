/**
 * @file test_node_arena.cpp
 * @brief Unit tests for the generational node arena and its edge book-keeping.
 */

#include <catch2/catch_test_macros.hpp>
#include <reflow/runtime/node_arena.h>
#include <reflow/types/error_type.h>

#include <cstdint>
#include <limits>
#include <vector>

using namespace reflow;

namespace {

NodeId make_node(NodeArena &arena, NodeKind kind = NodeKind::SIGNAL) {
    return arena.allocate(
        ReactiveNode{kind, NodeState::CLEAN, std::make_shared<ValueCell>(AnyValue::make<int>(0)), nullptr, ScopeId{}});
}

// A key with a narrow generation so the counter can be run to its limit
struct ShortKey {
    std::uint32_t slot{std::numeric_limits<std::uint32_t>::max()};
    std::uint8_t generation{0};

    [[nodiscard]] bool is_null() const noexcept { return slot == std::numeric_limits<std::uint32_t>::max(); }
};

}  // namespace

// ============================================================================
// SlotArena
// ============================================================================

TEST_CASE("SlotArena - removed keys never resolve again", "[arena]") {
    SlotArena<NodeId, int> arena;
    auto first = arena.insert(1);
    CHECK(*arena.get(first) == 1);

    CHECK(arena.remove(first) == 1);
    CHECK(arena.get(first) == nullptr);
    CHECK_FALSE(arena.remove(first).has_value());

    auto second = arena.insert(2);
    CHECK(second.slot == first.slot);
    CHECK(second.generation == first.generation + 1);
    CHECK(arena.get(first) == nullptr);
    CHECK(*arena.get(second) == 2);
    CHECK(arena.size() == 1);
}

TEST_CASE("SlotArena - a slot is retired once its generation is exhausted", "[arena]") {
    SlotArena<ShortKey, int> arena;
    auto first = arena.insert(0);
    auto key = first;
    for (int i = 1; i <= 255; ++i) {
        arena.remove(key);
        key = arena.insert(i);
        REQUIRE(key.slot == first.slot);
    }
    CHECK(key.generation == 255);

    arena.remove(key);
    auto next = arena.insert(256);
    CHECK(next.slot != first.slot);
    CHECK(arena.get(key) == nullptr);
    CHECK(arena.get(first) == nullptr);
    CHECK(*arena.get(next) == 256);
    CHECK(arena.size() == 1);
}

TEST_CASE("SlotArena - for_each visits live entries only", "[arena]") {
    SlotArena<NodeId, int> arena;
    auto a = arena.insert(1);
    arena.insert(2);
    arena.insert(3);
    arena.remove(a);

    int sum = 0;
    arena.for_each([&sum](NodeId, int value) { sum += value; });
    CHECK(sum == 5);
}

// ============================================================================
// Allocation and disposal
// ============================================================================

TEST_CASE("NodeArena - allocate and look up", "[arena]") {
    NodeArena arena;
    auto id = make_node(arena, NodeKind::MEMO);
    CHECK(arena.contains(id));
    CHECK(arena.get(id).kind == NodeKind::MEMO);
    CHECK(arena.size() == 1);
}

TEST_CASE("NodeArena - disposed ids raise DisposedError", "[arena]") {
    NodeArena arena;
    auto id = make_node(arena);
    CHECK(arena.dispose(id));
    CHECK_FALSE(arena.contains(id));
    CHECK(arena.try_get(id) == nullptr);
    CHECK_THROWS_AS(arena.get(id), DisposedError);
    CHECK_FALSE(arena.dispose(id));
}

TEST_CASE("NodeArena - a reused slot does not resurrect old handles", "[arena]") {
    NodeArena arena;
    auto old_id = make_node(arena);
    arena.dispose(old_id);
    auto new_id = make_node(arena, NodeKind::TRIGGER);
    CHECK(new_id.slot == old_id.slot);
    CHECK_THROWS_AS(arena.get(old_id), DisposedError);
    CHECK(arena.get(new_id).kind == NodeKind::TRIGGER);
}

// ============================================================================
// Edges
// ============================================================================

TEST_CASE("NodeArena - link records both directions", "[arena][edges]") {
    NodeArena arena;
    auto source = make_node(arena);
    auto observer = make_node(arena, NodeKind::MEMO);
    arena.link(source, observer);

    CHECK(arena.sources_of(observer) == std::vector<NodeId>{source});
    CHECK(arena.subscribers_of(source) == std::vector<NodeId>{observer});

    // Linking twice keeps a single edge
    arena.link(source, observer);
    CHECK(arena.subscribers_of(source).size() == 1);
}

TEST_CASE("NodeArena - sources keep read order", "[arena][edges]") {
    NodeArena arena;
    auto a = make_node(arena);
    auto b = make_node(arena);
    auto c = make_node(arena);
    auto observer = make_node(arena, NodeKind::EFFECT);
    arena.link(c, observer);
    arena.link(a, observer);
    arena.link(b, observer);
    CHECK(arena.sources_of(observer) == std::vector<NodeId>{c, a, b});
}

TEST_CASE("NodeArena - clear_sources removes the matching subscriber edges", "[arena][edges]") {
    NodeArena arena;
    auto a = make_node(arena);
    auto b = make_node(arena);
    auto observer = make_node(arena, NodeKind::MEMO);
    arena.link(a, observer);
    arena.link(b, observer);

    arena.clear_sources(observer);
    CHECK(arena.sources_of(observer).empty());
    CHECK(arena.subscribers_of(a).empty());
    CHECK(arena.subscribers_of(b).empty());
}

TEST_CASE("NodeArena - dispose removes the node from every partner", "[arena][edges]") {
    NodeArena arena;
    auto source = make_node(arena);
    auto middle = make_node(arena, NodeKind::MEMO);
    auto sink = make_node(arena, NodeKind::EFFECT);
    arena.link(source, middle);
    arena.link(middle, sink);

    arena.dispose(middle);
    CHECK(arena.subscribers_of(source).empty());
    CHECK(arena.sources_of(sink).empty());
    CHECK(arena.size() == 2);
}

TEST_CASE("NodeArena - linking a disposed node is ignored", "[arena][edges]") {
    NodeArena arena;
    auto source = make_node(arena);
    auto observer = make_node(arena, NodeKind::MEMO);
    arena.dispose(observer);
    arena.link(source, observer);
    CHECK(arena.subscribers_of(source).empty());
}

/**
 * @file test_signal.cpp
 * @brief Tests for the typed signal handles: ReadSignal, WriteSignal and RwSignal.
 */

#include <catch2/catch_test_macros.hpp>
#include <reflow/reflow.h>

#include <string>
#include <vector>

using namespace reflow;

// ============================================================================
// Reading and writing
// ============================================================================

TEST_CASE("Signal - create_signal returns halves over the same node", "[api][signal]") {
    Runtime rt;
    auto [read, write] = create_signal(rt, 1);
    CHECK(read.id() == write.id());
    CHECK(read.get() == 1);

    write.set(2);
    CHECK(read.get() == 2);
    CHECK(read() == 2);

    write(3);
    CHECK(read.get_untracked() == 3);
}

TEST_CASE("Signal - update mutates in place", "[api][signal]") {
    Runtime rt;
    auto items = create_rw_signal(rt, std::vector<int>{1, 2});
    items.update([](std::vector<int> &v) { v.push_back(3); });
    CHECK(items.with([](const std::vector<int> &v) { return v.size(); }) == 3);
    CHECK(items.with_untracked([](const std::vector<int> &v) { return v.back(); }) == 3);
}

TEST_CASE("Signal - string values and implicit conversions", "[api][signal]") {
    Runtime rt;
    auto name = create_rw_signal(rt, std::string{"left"});
    name.set("right");
    CHECK(name.get() == "right");
}

TEST_CASE("Signal - split and read_only share the node", "[api][signal]") {
    Runtime rt;
    auto rw = create_rw_signal(rt, 10);
    auto [read, write] = rw.split();
    CHECK(read.id() == rw.id());
    CHECK(rw.read_only() == read);
    CHECK(rw.write_only() == write);

    write.update([](int &v) { v *= 2; });
    CHECK(rw.get() == 20);
}

TEST_CASE("Signal - writes through any half notify effects", "[api][signal]") {
    Runtime rt;
    auto seen = std::make_shared<std::vector<int>>();
    auto rw = create_rw_signal(rt, 0);
    auto write = rw.write_only();
    create_effect(rt, [rw, seen] { seen->push_back(rw.get()); });

    write.set(1);
    rw.set(2);
    CHECK(*seen == std::vector<int>{0, 1, 2});
}

// ============================================================================
// Disposal
// ============================================================================

TEST_CASE("Signal - disposed signals raise DisposedError", "[api][signal][disposed]") {
    Runtime rt;
    auto [read, write] = create_signal(rt, 1);
    write.dispose();

    CHECK(read.is_disposed());
    CHECK(write.is_disposed());
    CHECK_THROWS_AS(read.get(), DisposedError);
    CHECK_THROWS_AS(read.get_untracked(), DisposedError);
    CHECK_THROWS_AS(write.set(2), DisposedError);
    CHECK_THROWS_AS(write.update([](int &v) { ++v; }), DisposedError);
}

TEST_CASE("Signal - try_ variants report disposal instead of raising", "[api][signal][disposed]") {
    Runtime rt;
    auto rw = create_rw_signal(rt, std::string{"value"});

    CHECK(rw.try_get() == std::optional<std::string>{"value"});
    CHECK_FALSE(rw.try_set("next").has_value());
    CHECK(rw.try_update([](std::string &s) { return s.size(); }) == std::optional<std::size_t>{4});
    CHECK(rw.try_with([](const std::string &) {}));

    rw.dispose();
    CHECK_FALSE(rw.try_get().has_value());
    CHECK_FALSE(rw.try_get_untracked().has_value());
    CHECK(rw.try_set("lost") == std::optional<std::string>{"lost"});
    CHECK_FALSE(rw.try_update([](std::string &s) { s.clear(); }));
    CHECK_FALSE(rw.try_with([](const std::string &) {}));
}

TEST_CASE("Signal - a default handle is unbound", "[api][signal][disposed]") {
    RwSignal<int> unbound;
    CHECK(unbound.is_disposed());
    CHECK_THROWS_AS(unbound.get(), DisposedError);
    CHECK_FALSE(unbound.try_get().has_value());
}

TEST_CASE("Signal - labels are visible through the runtime", "[api][signal]") {
    Runtime rt;
    auto rw = create_rw_signal(rt, 0);
    rw.set_label("clicks");
    CHECK(rt.node_label(rw.id()) == "clicks");
    CHECK(rt.node_info(rw.id()).name() == "signal<0v0>:clicks");
    CHECK(rt.node_kind(rw.id()) == NodeKind::SIGNAL);
}

#include <reflow/runtime/dependency_tracker.h>
#include <reflow/runtime/node_arena.h>
#include <reflow/runtime/observers/runtime_observer.h>
#include <reflow/runtime/propagation_engine.h>
#include <reflow/runtime/runtime.h>
#include <reflow/types/error_type.h>
#include <reflow/util/scope.h>

namespace reflow {
    PropagationEngine::PropagationEngine(Runtime &runtime)
        : _runtime{runtime}, _arena{runtime.arena()}, _tracker{runtime.tracker()} {}

    void PropagationEngine::mark_dirty(NodeId id) {
        auto *written = _arena.try_get(id);
        if (written == nullptr) { return; }

        ++_epoch;
        written->mark_epoch = _epoch;
        // The write is the change, direct subscribers are known to be out of date
        written->state = NodeState::CLEAN;

        auto current = _tracker.current_observer();
        std::vector<NodeId> stack;
        for (auto next : written->subscribers) {
            auto *node = _arena.try_get(next);
            if (node == nullptr || node->mark_epoch == _epoch) { continue; }
            node->mark_epoch = _epoch;
            node->state = NodeState::DIRTY;
            if (node->kind == NodeKind::EFFECT && !node->pending && current != next) { enqueue(*node, next); }
        }
        for (auto it = written->subscribers.values().rbegin(); it != written->subscribers.values().rend(); ++it) {
            if (auto *node = _arena.try_get(*it)) {
                const auto &subscribers = node->subscribers.values();
                stack.insert(stack.end(), subscribers.rbegin(), subscribers.rend());
            }
        }

        while (!stack.empty()) {
            auto next = stack.back();
            stack.pop_back();
            auto *node = _arena.try_get(next);
            // Disposed mid-traversal: treat as clean with no subscribers
            if (node == nullptr || node->mark_epoch == _epoch) { continue; }
            node->mark_epoch = _epoch;

            if (node->state < NodeState::CHECK) { node->state = NodeState::CHECK; }
            if (node->kind == NodeKind::EFFECT && !node->pending && current != next) { enqueue(*node, next); }

            // Reversed so subscribers are visited in the order they subscribed
            const auto &subscribers = node->subscribers.values();
            stack.insert(stack.end(), subscribers.rbegin(), subscribers.rend());
        }
    }

    void PropagationEngine::enqueue(ReactiveNode &node, NodeId id) {
        node.pending = true;
        _queue.push_back(id);
        if (_runtime.has_observers()) {
            auto info = _runtime.node_info(id);
            _runtime.notify_observers([&](RuntimeObserver &o) { o.on_effect_queued(info); });
        }
    }

    void PropagationEngine::update_if_necessary(NodeId id) {
        auto *node = _arena.try_get(id);
        if (node == nullptr) { return; }

        if (node->state == NodeState::CHECK) {
            // Copy, resolving a source may re-link this node's edges
            std::vector<NodeId> sources(node->sources.begin(), node->sources.end());
            for (auto source : sources) {
                update_if_necessary(source);
                node = _arena.try_get(id);
                if (node == nullptr) { return; }
                if (node->state == NodeState::DIRTY) { break; }
            }
        }

        if (node->state == NodeState::DIRTY) {
            if (update(id)) { mark_subscribers_dirty(id); }
            node = _arena.try_get(id);
            if (node == nullptr) { return; }
        }

        node->state = NodeState::CLEAN;
    }

    bool PropagationEngine::update(NodeId id) {
        switch (_arena.get(id).kind) {
            case NodeKind::SIGNAL:
            case NodeKind::TRIGGER:
                return true;
            case NodeKind::MEMO:
            case NodeKind::EFFECT:
                return run_computation(id);
        }
        return false;
    }

    bool PropagationEngine::run_computation(NodeId id) {
        auto &node = _arena.get(id);
        if (node.running) {
            throw_error<BorrowConflictError>(
                fmt::format("{} is already running, its computation depends on itself", _runtime.node_info(id).name()));
        }

        // Hold on to the closure and the cell, the node may be disposed while it runs
        auto compute = node.compute;
        auto cell = node.value;
        auto owner = node.owner;
        node.running = true;
        _arena.clear_sources(id);

        auto reset_running = make_scope_exit([this, id] {
            if (auto *n = _arena.try_get(id)) { n->running = false; }
        });

        NodeInfo info = _runtime.node_info(id);
        _runtime.notify_observers([&](RuntimeObserver &o) { o.on_before_node_run(info); });

        bool changed;
        try {
            changed = _runtime.with_owner(owner, [&] {
                return _tracker.with_observer(id, [&] { return compute->run(*cell); });
            });
        } catch (const ReactiveError &) {
            throw;
        } catch (const std::exception &e) {
            throw ComputeError::capture_error(e, info, "during computation");
        }

        _runtime.notify_observers([&](RuntimeObserver &o) { o.on_after_node_run(info, changed); });
        return changed;
    }

    void PropagationEngine::mark_subscribers_dirty(NodeId id) {
        auto *node = _arena.try_get(id);
        if (node == nullptr) { return; }
        for (auto subscriber : node->subscribers) {
            if (auto *sub = _arena.try_get(subscriber)) { sub->state = NodeState::DIRTY; }
        }
    }

    void PropagationEngine::run_effects() {
        if (_draining || _batch_depth > 0 || _queue.empty()) { return; }

        auto release = restore_on_exit(_draining);
        _draining = true;

        _runtime.notify_observers([&](RuntimeObserver &o) { o.on_before_run_effects(_queue.size()); });
        while (!_queue.empty()) {
            auto id = _queue.front();
            _queue.pop_front();
            auto *node = _arena.try_get(id);
            if (node == nullptr) { continue; }
            node->pending = false;
            update_if_necessary(id);
        }
        _runtime.notify_observers([&](RuntimeObserver &o) { o.on_after_run_effects(); });
    }
} // namespace reflow

#include <reflow/runtime/observers/runtime_trace.h>
#include <reflow/runtime/runtime.h>
#include <reflow/types/error_type.h>

#include <algorithm>
#include <cstdio>

namespace reflow {
    Runtime::Runtime(RuntimeConfig config)
        : _tracker{_arena}, _engine{*this}, _observers{std::move(config.observers)}, _current_scope{_scopes.root()} {
        if (config.trace) { _observers.push_back(std::make_shared<RuntimeTrace>(config.trace_filter)); }
    }

    Runtime::~Runtime() {
        try {
            dispose_scope(_scopes.root());
        } catch (const std::exception &e) {
            fmt::print(stderr, "reflow: error while disposing the runtime: {}\n", e.what());
        }
    }

    NodeId Runtime::allocate_node(NodeKind kind, NodeState state, value_cell_s_ptr value, Computation::s_ptr compute) {
        auto owner = _current_scope;
        auto &scope = _scopes.get(owner);
        auto id = _arena.allocate(ReactiveNode{kind, state, std::move(value), std::move(compute), owner});
        scope.nodes.push_back(id);
        if (has_observers()) {
            auto info = node_info(id);
            notify_observers([&](RuntimeObserver &o) { o.on_node_created(info); });
        }
        return id;
    }

    NodeId Runtime::create_signal_node(AnyValue value) {
        return allocate_node(NodeKind::SIGNAL, NodeState::CLEAN, std::make_shared<ValueCell>(std::move(value)),
                             nullptr);
    }

    NodeId Runtime::create_memo_node(Computation::s_ptr compute) {
        return allocate_node(NodeKind::MEMO, NodeState::DIRTY, std::make_shared<ValueCell>(), std::move(compute));
    }

    NodeId Runtime::create_effect_node(Computation::s_ptr compute) {
        auto id = allocate_node(NodeKind::EFFECT, NodeState::DIRTY, std::make_shared<ValueCell>(), std::move(compute));
        try {
            _engine.update_if_necessary(id);
        } catch (...) {
            // The caller never receives a handle, so nothing could stop it later
            dispose_node(id);
            throw;
        }
        return id;
    }

    NodeId Runtime::create_trigger_node() {
        return allocate_node(NodeKind::TRIGGER, NodeState::CLEAN, nullptr, nullptr);
    }

    void Runtime::dispose_node(NodeId id) {
        auto *node = _arena.try_get(id);
        if (node == nullptr) { return; }
        if (has_observers()) {
            auto info = node_info(id);
            notify_observers([&](RuntimeObserver &o) { o.on_node_disposed(info); });
            node = _arena.try_get(id);
            if (node == nullptr) { return; }
        }
        auto owner = node->owner;
        _arena.dispose(id);
        if (auto *scope = _scopes.try_get(owner)) {
            auto &nodes = scope->nodes;
            nodes.erase(std::remove(nodes.begin(), nodes.end(), id), nodes.end());
        }
    }

    value_cell_s_ptr Runtime::value_cell(NodeId id, bool track) {
        auto &node = _arena.get(id);
        if (node.kind == NodeKind::TRIGGER) {
            throw_error<ReactiveError>(fmt::format("{} is a trigger and carries no value", node_info(id).name()));
        }
        if (node.kind == NodeKind::MEMO) {
            if (node.running) {
                throw_error<BorrowConflictError>(
                    fmt::format("{} was read from its own computation", node_info(id).name()));
            }
            _engine.update_if_necessary(id);
        }
        // Resolving a memo runs user code, look the node up again
        auto cell = _arena.get(id).value;
        if (track) { _tracker.track_read(id); }
        return cell;
    }

    value_cell_s_ptr Runtime::try_value_cell(NodeId id, bool track) {
        if (!_arena.contains(id)) { return nullptr; }
        return value_cell(id, track);
    }

    void Runtime::check_not_read_by_memo(NodeId id) {
        for (const auto &frame : _tracker.frames()) {
            if (!frame) { continue; }
            auto *observer = _arena.try_get(*frame);
            if (observer != nullptr && observer->kind == NodeKind::MEMO && observer->sources.contains(id)) {
                throw_error<BorrowConflictError>(fmt::format("{} was written while {} is computing from it",
                                                             node_info(id).name(), node_info(*frame).name()));
            }
        }
    }

    value_cell_s_ptr Runtime::writable_cell(NodeId id) {
        auto &node = _arena.get(id);
        if (node.kind != NodeKind::SIGNAL) {
            throw_error<ReactiveError>(fmt::format("{} is not a signal and cannot be written", node_info(id).name()));
        }
        check_not_read_by_memo(id);
        return node.value;
    }

    value_cell_s_ptr Runtime::try_writable_cell(NodeId id) {
        if (!_arena.contains(id)) { return nullptr; }
        return writable_cell(id);
    }

    void Runtime::notify_changed(NodeId id) {
        if (!_arena.contains(id)) { return; }
        if (has_observers()) {
            auto info = node_info(id);
            notify_observers([&](RuntimeObserver &o) { o.on_signal_write(info); });
        }
        _engine.mark_dirty(id);
        _engine.run_effects();
    }

    void Runtime::track(NodeId id) {
        if (!_arena.contains(id)) { throw_error<DisposedError>(fmt::format("Node {} has been disposed", id)); }
        _tracker.track_read(id);
    }

    void Runtime::run_effects() { _engine.run_effects(); }

    ScopeId Runtime::create_scope(ScopeId parent) {
        auto id = _scopes.create(parent);
        notify_observers([&](RuntimeObserver &o) { o.on_scope_created(id); });
        return id;
    }

    void Runtime::dispose_scope(ScopeId id) {
        auto state = _scopes.remove(id);
        if (!state) { return; }
        notify_observers([&](RuntimeObserver &o) { o.on_scope_disposed(id); });

        auto dispose_owned = [this, &state] {
            for (auto stored : state->stored_values) { _scopes.dispose_stored(stored); }
            for (auto node : state->nodes) { dispose_node(node); }
        };

        // Owned values go even if a child or a cleanup raises
        try {
            for (auto child : state->children) { dispose_scope(child); }
            auto cleanups = std::move(state->cleanups);
            for (auto &cleanup : cleanups) { cleanup(); }
        } catch (...) {
            dispose_owned();
            throw;
        }
        dispose_owned();
    }

    std::optional<ScopeId> Runtime::scope_parent(ScopeId id) {
        auto parent = _scopes.get(id).parent;
        if (parent.is_null()) { return std::nullopt; }
        return parent;
    }

    void Runtime::on_cleanup(ScopeId id, std::function<void()> cleanup) {
        _scopes.get(id).cleanups.push_back(std::move(cleanup));
    }

    void Runtime::provide_context(std::type_index type, AnyValue value) {
        _scopes.get(_current_scope).contexts.insert_or_assign(type, std::move(value));
    }

    const AnyValue *Runtime::find_context(std::type_index type) { return _scopes.find_context(_current_scope, type); }

    StoredValueId Runtime::store_value(AnyValue value) { return _scopes.store(_current_scope, std::move(value)); }

    void Runtime::add_observer(RuntimeObserver::s_ptr observer) { _observers.push_back(std::move(observer)); }

    void Runtime::remove_observer(const RuntimeObserver::s_ptr &observer) {
        _observers.erase(std::remove(_observers.begin(), _observers.end(), observer), _observers.end());
    }

    void Runtime::set_label(NodeId id, std::string label) { _arena.get(id).label = std::move(label); }

    NodeInfo Runtime::node_info(NodeId id) const {
        const auto &node = _arena.get(id);
        return NodeInfo{id, node.kind, node.label};
    }
} // namespace reflow

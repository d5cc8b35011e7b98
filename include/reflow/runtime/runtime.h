#ifndef REFLOW_RUNTIME_H
#define REFLOW_RUNTIME_H

#include <reflow/reflow_base.h>
#include <reflow/runtime/dependency_tracker.h>
#include <reflow/runtime/node_arena.h>
#include <reflow/runtime/observers/runtime_observer.h>
#include <reflow/runtime/propagation_engine.h>
#include <reflow/runtime/runtime_config.h>
#include <reflow/runtime/scope_tree.h>
#include <reflow/util/scope.h>

#include <type_traits>
#include <typeindex>

namespace reflow {
    /**
     * The owner of one reactive graph.
     *
     * The Runtime holds the node arena, the observer stack, the effect queue and the scope tree. Handles refer back
     * to it by raw pointer, so a Runtime must outlive every handle created from it and cannot be moved. Destroying
     * the Runtime disposes the root scope, running every registered cleanup.
     *
     * All operations are single threaded. The type-erased operations here are the building blocks of the typed
     * front-end in reflow/api.
     */
    struct REFLOW_EXPORT Runtime {
        explicit Runtime(RuntimeConfig config = {});

        ~Runtime();

        Runtime(const Runtime &) = delete;

        Runtime &operator=(const Runtime &) = delete;

        Runtime(Runtime &&) = delete;

        Runtime &operator=(Runtime &&) = delete;

        [[nodiscard]] NodeArena &arena() noexcept { return _arena; }

        [[nodiscard]] DependencyTracker &tracker() noexcept { return _tracker; }

        [[nodiscard]] PropagationEngine &engine() noexcept { return _engine; }

        [[nodiscard]] ScopeTree &scopes() noexcept { return _scopes; }

        // Node creation, every node is owned by the current scope

        NodeId create_signal_node(AnyValue value);

        // Memos are created DIRTY and compute on first read
        NodeId create_memo_node(Computation::s_ptr compute);

        // Effects run once immediately to establish their sources
        NodeId create_effect_node(Computation::s_ptr compute);

        NodeId create_trigger_node();

        void dispose_node(NodeId id);

        // Value access

        /**
         * The value cell of a node, brought up to date first if it is a Memo. When track is true the read is
         * recorded against the current observer. Raises DisposedError for a disposed node and BorrowConflictError if
         * a Memo is read from its own computation.
         */
        [[nodiscard]] value_cell_s_ptr value_cell(NodeId id, bool track);

        // As value_cell, but returns nullptr for a disposed node
        [[nodiscard]] value_cell_s_ptr try_value_cell(NodeId id, bool track);

        /**
         * The value cell of a Signal about to be written. Raises BorrowConflictError when a Memo computation on the
         * observer stack has already read the signal in its current run.
         */
        [[nodiscard]] value_cell_s_ptr writable_cell(NodeId id);

        [[nodiscard]] value_cell_s_ptr try_writable_cell(NodeId id);

        /**
         * Propagates a change of a Signal or Trigger and drains the effect queue (unless batching).
         */
        void notify_changed(NodeId id);

        // Registers a dependency on a Trigger
        void track(NodeId id);

        void run_effects();

        template<typename Fn>
        decltype(auto) batch(Fn &&fn) {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
                {
                    _engine.begin_batch();
                    auto end = make_scope_exit([this] { _engine.end_batch(); });
                    std::forward<Fn>(fn)();
                }
                run_effects();
            } else {
                auto result = [&] {
                    _engine.begin_batch();
                    auto end = make_scope_exit([this] { _engine.end_batch(); });
                    return std::forward<Fn>(fn)();
                }();
                run_effects();
                return result;
            }
        }

        template<typename Fn>
        decltype(auto) untrack(Fn &&fn) { return _tracker.untracked(std::forward<Fn>(fn)); }

        /**
         * Runs fn with owner as the current scope.
         */
        template<typename Fn>
        decltype(auto) with_owner(ScopeId owner, Fn &&fn) {
            auto restore = restore_on_exit(_current_scope);
            _current_scope = owner;
            return std::forward<Fn>(fn)();
        }

        // Scopes

        [[nodiscard]] ScopeId root_scope() const noexcept { return _scopes.root(); }

        [[nodiscard]] ScopeId current_scope() const noexcept { return _current_scope; }

        ScopeId create_scope(ScopeId parent);

        /**
         * Disposes child scopes, runs the cleanups in registration order, then disposes the stored values and nodes
         * the scope owns. Disposing an already disposed scope does nothing.
         */
        void dispose_scope(ScopeId id);

        [[nodiscard]] bool is_scope_alive(ScopeId id) const noexcept { return _scopes.contains(id); }

        [[nodiscard]] std::optional<ScopeId> scope_parent(ScopeId id);

        void on_cleanup(ScopeId id, std::function<void()> cleanup);

        // Context

        void provide_context(std::type_index type, AnyValue value);

        [[nodiscard]] const AnyValue *find_context(std::type_index type);

        // Stored values

        StoredValueId store_value(AnyValue value);

        [[nodiscard]] value_cell_s_ptr stored_cell(StoredValueId id) { return _scopes.stored_cell(id); }

        [[nodiscard]] value_cell_s_ptr try_stored_cell(StoredValueId id) noexcept { return _scopes.try_stored_cell(id); }

        // Observers

        void add_observer(RuntimeObserver::s_ptr observer);

        void remove_observer(const RuntimeObserver::s_ptr &observer);

        [[nodiscard]] bool has_observers() const noexcept { return !_observers.empty(); }

        [[nodiscard]] const std::vector<RuntimeObserver::s_ptr> &observers() const noexcept { return _observers; }

        template<typename Fn>
        void notify_observers(Fn &&fn) {
            // Index based, an observer may register another observer
            for (std::size_t i = 0; i < _observers.size(); ++i) {
                auto observer = _observers[i];
                fn(*observer);
            }
        }

        // Introspection

        [[nodiscard]] std::size_t node_count() const noexcept { return _arena.size(); }

        [[nodiscard]] std::size_t scope_count() const noexcept { return _scopes.size(); }

        [[nodiscard]] bool contains(NodeId id) const noexcept { return _arena.contains(id); }

        [[nodiscard]] NodeState node_state(NodeId id) const { return _arena.get(id).state; }

        [[nodiscard]] NodeKind node_kind(NodeId id) const { return _arena.get(id).kind; }

        [[nodiscard]] const std::string &node_label(NodeId id) const { return _arena.get(id).label; }

        void set_label(NodeId id, std::string label);

        [[nodiscard]] NodeInfo node_info(NodeId id) const;

        [[nodiscard]] std::vector<NodeId> sources_of(NodeId id) const { return _arena.sources_of(id); }

        [[nodiscard]] std::vector<NodeId> subscribers_of(NodeId id) const { return _arena.subscribers_of(id); }

    private:
        NodeId allocate_node(NodeKind kind, NodeState state, value_cell_s_ptr value, Computation::s_ptr compute);

        void check_not_read_by_memo(NodeId id);

        NodeArena _arena;
        DependencyTracker _tracker;
        ScopeTree _scopes;
        PropagationEngine _engine;
        std::vector<RuntimeObserver::s_ptr> _observers;
        ScopeId _current_scope;
    };
} // namespace reflow

#endif  // REFLOW_RUNTIME_H

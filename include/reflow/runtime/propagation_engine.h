#ifndef REFLOW_PROPAGATION_ENGINE_H
#define REFLOW_PROPAGATION_ENGINE_H

#include <reflow/reflow_base.h>
#include <reflow/types/node.h>

#include <deque>

namespace reflow {
    /**
     * Push-pull propagation over the node graph of a Runtime.
     *
     * A write marks the direct subscribers of the written node DIRTY and pushes CHECK to everything further
     * downstream, queueing the effects it reaches. The written node itself is left CLEAN. Draining the queue pulls: each effect is resolved by resolving its sources
     * first, so only nodes whose inputs actually changed are recomputed, and each at most once per pass.
     *
     * The engine switches on NodeKind rather than dispatching through the nodes, the only virtual call is into the
     * user's Computation.
     */
    struct REFLOW_EXPORT PropagationEngine {
        explicit PropagationEngine(Runtime &runtime);

        /**
         * Marks the subscribers of id DIRTY and everything below them CHECK, queueing the reached effects.
         */
        void mark_dirty(NodeId id);

        /**
         * Brings id up to date: resolves a CHECK node's sources in order and recomputes it if any changed.
         * Raises ComputeError (or the ReactiveError the computation raised) if a computation fails, the failing
         * node keeps its DIRTY / CHECK state.
         */
        void update_if_necessary(NodeId id);

        /**
         * Drains the effect queue unless a batch is open or a drain is already running further up the stack, in
         * which case the queued effects are picked up by that drain.
         */
        void run_effects();

        void begin_batch() noexcept { ++_batch_depth; }

        void end_batch() noexcept { --_batch_depth; }

        [[nodiscard]] bool is_batching() const noexcept { return _batch_depth > 0; }

        [[nodiscard]] bool is_draining() const noexcept { return _draining; }

        [[nodiscard]] std::size_t queued() const noexcept { return _queue.size(); }

    private:
        bool update(NodeId id);

        bool run_computation(NodeId id);

        void mark_subscribers_dirty(NodeId id);

        void enqueue(ReactiveNode &node, NodeId id);

        Runtime &_runtime;
        NodeArena &_arena;
        DependencyTracker &_tracker;
        std::deque<NodeId> _queue;
        std::uint64_t _epoch{0};
        std::size_t _batch_depth{0};
        bool _draining{false};
    };
} // namespace reflow

#endif  // REFLOW_PROPAGATION_ENGINE_H

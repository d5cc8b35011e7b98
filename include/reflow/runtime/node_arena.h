#ifndef REFLOW_NODE_ARENA_H
#define REFLOW_NODE_ARENA_H

#include <reflow/reflow_base.h>
#include <reflow/runtime/slot_arena.h>
#include <reflow/types/node.h>

namespace reflow {
    /**
     * Owns every reactive node of a Runtime.
     *
     * Nodes are addressed by generational NodeIds. Edges are kept symmetric: link() records the pair on both ends,
     * clear_sources() and dispose() remove the node from each partner before dropping its own side.
     *
     * References returned by get()/try_get() are only valid until the next allocate(), callers that run user code
     * must re-resolve the id afterwards.
     */
    struct REFLOW_EXPORT NodeArena {
        NodeId allocate(ReactiveNode node);

        /**
         * Generation checked lookup, raises DisposedError if the node is gone.
         */
        [[nodiscard]] ReactiveNode &get(NodeId id);

        [[nodiscard]] const ReactiveNode &get(NodeId id) const;

        [[nodiscard]] ReactiveNode *try_get(NodeId id) noexcept { return _nodes.get(id); }

        [[nodiscard]] const ReactiveNode *try_get(NodeId id) const noexcept { return _nodes.get(id); }

        [[nodiscard]] bool contains(NodeId id) const noexcept { return _nodes.contains(id); }

        /**
         * Removes the node and its edges. Returns false when the id was already disposed.
         */
        bool dispose(NodeId id);

        /**
         * Records that observer read source during its current run.
         */
        void link(NodeId source, NodeId observer);

        /**
         * Drops every source edge of id (and the matching subscriber edge on each source).
         */
        void clear_sources(NodeId id);

        [[nodiscard]] std::vector<NodeId> sources_of(NodeId id) const;

        [[nodiscard]] std::vector<NodeId> subscribers_of(NodeId id) const;

        [[nodiscard]] std::size_t size() const noexcept { return _nodes.size(); }

    private:
        SlotArena<NodeId, ReactiveNode> _nodes;
    };
} // namespace reflow

#endif  // REFLOW_NODE_ARENA_H

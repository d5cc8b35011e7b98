#ifndef REFLOW_SCOPE_TREE_H
#define REFLOW_SCOPE_TREE_H

#include <reflow/reflow_base.h>
#include <reflow/runtime/slot_arena.h>
#include <reflow/types/any_value.h>
#include <reflow/types/node.h>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <typeindex>

namespace reflow {
    /**
     * Book-keeping of one disposal boundary.
     */
    struct REFLOW_EXPORT ScopeState {
        explicit ScopeState(ScopeId parent_) : parent{parent_} {}

        ScopeId parent;
        std::vector<ScopeId> children;
        std::vector<NodeId> nodes;
        std::vector<StoredValueId> stored_values;
        std::vector<std::function<void()>> cleanups;
        ankerl::unordered_dense::map<std::type_index, AnyValue> contexts;
    };

    /**
     * The scope hierarchy of a Runtime together with the non-reactive values the scopes own.
     *
     * The tree only keeps the structure; ordering of disposal (children, cleanups, then owned values and nodes) is
     * driven by the Runtime, which also has to dispose the nodes from the arena.
     */
    struct REFLOW_EXPORT ScopeTree {
        ScopeTree();

        [[nodiscard]] ScopeId root() const noexcept { return _root; }

        ScopeId create(ScopeId parent);

        [[nodiscard]] ScopeState &get(ScopeId id);

        [[nodiscard]] ScopeState *try_get(ScopeId id) noexcept { return _scopes.get(id); }

        [[nodiscard]] bool contains(ScopeId id) const noexcept { return _scopes.contains(id); }

        /**
         * Detaches the scope from its parent and hands back its state, the caller finishes the disposal.
         */
        std::optional<ScopeState> remove(ScopeId id);

        /**
         * Walks from id towards the root looking for a context of the given type.
         */
        [[nodiscard]] const AnyValue *find_context(ScopeId id, const std::type_index &type);

        StoredValueId store(ScopeId owner, AnyValue value);

        [[nodiscard]] value_cell_s_ptr stored_cell(StoredValueId id);

        [[nodiscard]] value_cell_s_ptr try_stored_cell(StoredValueId id) noexcept;

        void dispose_stored(StoredValueId id);

        [[nodiscard]] std::size_t size() const noexcept { return _scopes.size(); }

        [[nodiscard]] std::size_t stored_count() const noexcept { return _stored.size(); }

    private:
        SlotArena<ScopeId, ScopeState> _scopes;
        SlotArena<StoredValueId, value_cell_s_ptr> _stored;
        ScopeId _root;
    };
} // namespace reflow

#endif  // REFLOW_SCOPE_TREE_H

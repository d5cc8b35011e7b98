#ifndef REFLOW_NODE_H
#define REFLOW_NODE_H

#include <reflow/reflow_base.h>
#include <reflow/types/any_value.h>
#include <reflow/types/node_id.h>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <string_view>

namespace reflow {
    enum class NodeKind : std::uint8_t {
        SIGNAL = 0,
        MEMO = 1,
        EFFECT = 2,
        TRIGGER = 3
    };

    /**
     * The propagation state of a node, ordered by strength: CLEAN < CHECK < DIRTY.
     */
    enum class NodeState : std::uint8_t {
        CLEAN = 0,
        CHECK = 1,
        DIRTY = 2
    };

    REFLOW_EXPORT std::string_view to_string(NodeKind kind) noexcept;

    REFLOW_EXPORT std::string_view to_string(NodeState state) noexcept;

    using node_set = ankerl::unordered_dense::set<NodeId>;

    /**
     * The value cell of a Signal, Memo or Effect.
     *
     * The cell is shared between the arena entry and any reader currently holding a borrow, so a node disposed in the
     * middle of a read or a computation does not pull the value out from under the caller. Borrows follow the
     * single-writer / many-readers rule, a conflicting borrow raises BorrowConflictError.
     */
    struct REFLOW_EXPORT ValueCell {
        using s_ptr = std::shared_ptr<ValueCell>;

        struct REFLOW_EXPORT ReadBorrow {
            explicit ReadBorrow(ValueCell &cell);

            ReadBorrow(const ReadBorrow &) = delete;

            ReadBorrow &operator=(const ReadBorrow &) = delete;

            ~ReadBorrow();

        private:
            ValueCell &_cell;
        };

        struct REFLOW_EXPORT WriteBorrow {
            explicit WriteBorrow(ValueCell &cell);

            WriteBorrow(const WriteBorrow &) = delete;

            WriteBorrow &operator=(const WriteBorrow &) = delete;

            ~WriteBorrow();

        private:
            ValueCell &_cell;
        };

        ValueCell() = default;

        explicit ValueCell(AnyValue value_);

        AnyValue value;

        [[nodiscard]] ReadBorrow borrow() { return ReadBorrow{*this}; }

        [[nodiscard]] WriteBorrow borrow_mut() { return WriteBorrow{*this}; }

        [[nodiscard]] bool is_borrowed() const { return _readers > 0 || _writing; }

        [[nodiscard]] bool is_borrowed_mut() const { return _writing; }

    private:
        std::int32_t _readers{0};
        bool _writing{false};
    };

    /**
     * The closure stored in a Memo or Effect node.
     *
     * run is invoked with the dependency tracker observing the owning node, it reads whatever it depends on and
     * writes its result into the node's value cell. The return value reports whether the node's value changed:
     * Memos compare the new value against the previous one, Effects always report a change.
     */
    struct REFLOW_EXPORT Computation {
        using s_ptr = std::shared_ptr<Computation>;

        virtual ~Computation() = default;

        virtual bool run(ValueCell &cell) = 0;
    };

    struct REFLOW_EXPORT ReactiveNode {
        ReactiveNode(NodeKind kind_, NodeState state_, ValueCell::s_ptr value_, Computation::s_ptr compute_,
                     ScopeId owner_);

        NodeKind kind;
        NodeState state;
        ValueCell::s_ptr value;      // absent for TRIGGER
        Computation::s_ptr compute;  // present for MEMO and EFFECT only
        node_set sources;
        node_set subscribers;
        ScopeId owner;
        std::string label;

        // Scheduling book-keeping used by the propagation engine
        bool pending{false};
        bool running{false};
        std::uint64_t mark_epoch{0};

        [[nodiscard]] bool is_computed() const { return kind == NodeKind::MEMO || kind == NodeKind::EFFECT; }
    };

    /**
     * A light-weight description of a node handed to observers and error reporting.
     */
    struct REFLOW_EXPORT NodeInfo {
        NodeId id;
        NodeKind kind;
        std::string label;

        [[nodiscard]] std::string name() const;
    };
} // namespace reflow

template<>
struct fmt::formatter<reflow::NodeKind> : fmt::formatter<std::string_view> {
    auto format(reflow::NodeKind kind, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(reflow::to_string(kind), ctx);
    }
};

template<>
struct fmt::formatter<reflow::NodeState> : fmt::formatter<std::string_view> {
    auto format(reflow::NodeState state, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(reflow::to_string(state), ctx);
    }
};

#endif  // REFLOW_NODE_H

#ifndef REFLOW_DEPENDENCY_TRACKER_H
#define REFLOW_DEPENDENCY_TRACKER_H

#include <reflow/reflow_base.h>
#include <reflow/types/node_id.h>
#include <reflow/util/scope.h>

#include <utility>

namespace reflow {
    /**
     * The "who is reading right now" stack of a Runtime.
     *
     * Each frame is the node whose computation is running, or empty for an untracked section. Reads performed while
     * the top frame holds a node are recorded as edges in the arena.
     */
    struct REFLOW_EXPORT DependencyTracker {
        explicit DependencyTracker(NodeArena &arena);

        template<typename Fn>
        decltype(auto) with_observer(std::optional<NodeId> observer, Fn &&fn) {
            _stack.push_back(observer);
            auto restore = make_scope_exit([this] { _stack.pop_back(); });
            return std::forward<Fn>(fn)();
        }

        template<typename Fn>
        decltype(auto) untracked(Fn &&fn) { return with_observer(std::nullopt, std::forward<Fn>(fn)); }

        /**
         * Links source to the current observer, if there is one that is still alive.
         */
        void track_read(NodeId source);

        [[nodiscard]] std::optional<NodeId> current_observer() const noexcept;

        [[nodiscard]] bool is_tracking() const noexcept { return current_observer().has_value(); }

        [[nodiscard]] std::size_t depth() const noexcept { return _stack.size(); }

        /**
         * All frames, outermost first.
         */
        [[nodiscard]] const std::vector<std::optional<NodeId>> &frames() const noexcept { return _stack; }

    private:
        NodeArena &_arena;
        std::vector<std::optional<NodeId>> _stack;
    };
} // namespace reflow

#endif  // REFLOW_DEPENDENCY_TRACKER_H

#include <reflow/runtime/dependency_tracker.h>
#include <reflow/runtime/node_arena.h>

namespace reflow {
    DependencyTracker::DependencyTracker(NodeArena &arena) : _arena{arena} {}

    void DependencyTracker::track_read(NodeId source) {
        auto observer = current_observer();
        if (!observer || *observer == source) { return; }
        _arena.link(source, *observer);
    }

    std::optional<NodeId> DependencyTracker::current_observer() const noexcept {
        if (_stack.empty()) { return std::nullopt; }
        return _stack.back();
    }
} // namespace reflow

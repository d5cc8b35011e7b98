#include <reflow/runtime/node_arena.h>
#include <reflow/types/error_type.h>

namespace reflow {
    NodeId NodeArena::allocate(ReactiveNode node) { return _nodes.insert(std::move(node)); }

    ReactiveNode &NodeArena::get(NodeId id) {
        if (auto *node = _nodes.get(id)) { return *node; }
        throw_error<DisposedError>(fmt::format("Node {} has been disposed", id));
    }

    const ReactiveNode &NodeArena::get(NodeId id) const { return const_cast<NodeArena *>(this)->get(id); }

    bool NodeArena::dispose(NodeId id) {
        auto *node = _nodes.get(id);
        if (node == nullptr) { return false; }
        for (auto source : node->sources) {
            if (auto *partner = _nodes.get(source)) { partner->subscribers.erase(id); }
        }
        for (auto subscriber : node->subscribers) {
            if (auto *partner = _nodes.get(subscriber)) { partner->sources.erase(id); }
        }
        _nodes.remove(id);
        return true;
    }

    void NodeArena::link(NodeId source, NodeId observer) {
        auto *source_node = _nodes.get(source);
        auto *observer_node = _nodes.get(observer);
        if (source_node == nullptr || observer_node == nullptr) { return; }
        observer_node->sources.insert(source);
        source_node->subscribers.insert(observer);
    }

    void NodeArena::clear_sources(NodeId id) {
        auto *node = _nodes.get(id);
        if (node == nullptr) { return; }
        for (auto source : node->sources) {
            if (auto *partner = _nodes.get(source)) { partner->subscribers.erase(id); }
        }
        node->sources.clear();
    }

    std::vector<NodeId> NodeArena::sources_of(NodeId id) const {
        const auto &sources = get(id).sources;
        return {sources.begin(), sources.end()};
    }

    std::vector<NodeId> NodeArena::subscribers_of(NodeId id) const {
        const auto &subscribers = get(id).subscribers;
        return {subscribers.begin(), subscribers.end()};
    }
} // namespace reflow

#ifndef REFLOW_FORWARD_DECLARATIONS_H
#define REFLOW_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>

namespace reflow {
    // Runtime - owned by the caller, handles keep a raw back-pointer
    struct Runtime;
    using runtime_ptr = Runtime*;

    // Engine components - owned by the Runtime
    struct NodeArena;
    struct DependencyTracker;
    struct PropagationEngine;
    struct ScopeTree;

    // Node model
    struct ReactiveNode;
    using reactive_node_ptr = ReactiveNode*;

    struct ValueCell;
    using value_cell_s_ptr = std::shared_ptr<ValueCell>;

    struct Computation;
    using computation_s_ptr = std::shared_ptr<Computation>;

    // Observers - shared between the caller and the Runtime
    struct RuntimeObserver;
    using runtime_observer_ptr = RuntimeObserver*;
    using runtime_observer_s_ptr = std::shared_ptr<RuntimeObserver>;

    struct RuntimeConfig;

    // Typed front-end
    struct Scope;
    template<typename T> class ReadSignal;
    template<typename T> class WriteSignal;
    template<typename T> class RwSignal;
    template<typename T> class Memo;
    template<typename T> class StoredValue;
    template<typename T> class Signal;
    class Effect;
    class Trigger;

    using StopFn = std::function<void()>;
} // namespace reflow

#endif  // REFLOW_FORWARD_DECLARATIONS_H

#ifndef REFLOW_RUNTIME_OBSERVER_H
#define REFLOW_RUNTIME_OBSERVER_H

#include <reflow/reflow_base.h>
#include <reflow/types/node.h>

namespace reflow {
    // RuntimeObserver - externally managed observer, registered with Runtime::add_observer
    struct REFLOW_EXPORT RuntimeObserver {
        using ptr = RuntimeObserver *;
        using s_ptr = std::shared_ptr<RuntimeObserver>;

        virtual ~RuntimeObserver() = default;

        virtual void on_node_created(const NodeInfo &) {
        };

        virtual void on_node_disposed(const NodeInfo &) {
        };

        virtual void on_signal_write(const NodeInfo &) {
        };

        virtual void on_effect_queued(const NodeInfo &) {
        };

        virtual void on_before_node_run(const NodeInfo &) {
        };

        virtual void on_after_node_run(const NodeInfo &, bool /*changed*/) {
        };

        virtual void on_before_run_effects(std::size_t /*queued*/) {
        };

        virtual void on_after_run_effects() {
        };

        virtual void on_scope_created(ScopeId) {
        };

        virtual void on_scope_disposed(ScopeId) {
        };
    };
} // namespace reflow

#endif  // REFLOW_RUNTIME_OBSERVER_H

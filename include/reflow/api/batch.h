#ifndef REFLOW_API_BATCH_H
#define REFLOW_API_BATCH_H

#include <reflow/runtime/runtime.h>

namespace reflow {
    /**
     * Runs fn with propagation deferred: writes inside only mark the graph, the effect queue is drained once when
     * fn returns. If fn raises the queued effects stay pending until the next drain.
     */
    template<typename Fn>
    decltype(auto) batch(Runtime &rt, Fn &&fn) {
        return rt.batch(std::forward<Fn>(fn));
    }

    /**
     * Runs fn without a current observer, nothing read inside becomes a dependency.
     */
    template<typename Fn>
    decltype(auto) untrack(Runtime &rt, Fn &&fn) {
        return rt.untrack(std::forward<Fn>(fn));
    }
} // namespace reflow

#endif  // REFLOW_API_BATCH_H

#ifndef REFLOW_API_WATCH_H
#define REFLOW_API_WATCH_H

#include <reflow/api/effect.h>

namespace reflow {
    /**
     * Calls callback(current, previous) whenever the value produced by deps changes.
     *
     * Only deps is tracked, the callback runs untracked. With immediate the callback also runs once right away with
     * no previous value, otherwise the first run only records the value. The returned StopFn disposes the
     * underlying effect, an invocation already in progress completes.
     */
    template<typename DepsFn, typename Callback>
        requires std::invocable<DepsFn &>
    StopFn watch(Runtime &rt, DepsFn deps, Callback callback, bool immediate = false) {
        using W = std::decay_t<std::invoke_result_t<DepsFn &>>;
        static_assert(std::invocable<Callback &, const W &, const std::optional<W> &>,
                      "watch callback must accept (const W &current, const std::optional<W> &previous)");

        struct WatchState {
            std::optional<W> previous;
            bool first{true};
        };

        auto state = std::make_shared<WatchState>();
        runtime_ptr runtime = &rt;
        auto effect = create_effect(rt, [runtime, state, immediate, deps = std::move(deps),
                                         callback = std::move(callback)]() mutable {
            W current = deps();
            bool skip = state->first && !immediate;
            state->first = false;
            if (!skip) { runtime->untrack([&] { callback(std::as_const(current), std::as_const(state->previous)); }); }
            state->previous = std::move(current);
        });
        return [effect] { effect.dispose(); };
    }
} // namespace reflow

#endif  // REFLOW_API_WATCH_H

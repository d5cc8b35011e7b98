#ifndef REFLOW_API_DERIVED_SIGNAL_H
#define REFLOW_API_DERIVED_SIGNAL_H

#include <reflow/api/memo.h>
#include <reflow/api/signal.h>

namespace reflow {
    /**
     * A read-only view over anything that produces a T: a signal, a memo or a plain closure.
     *
     * A closure wrapped with derive() is not a node, it re-runs on every read and its reads are tracked by whoever
     * reads it. This is the way to derive values whose type has no equality.
     */
    template<typename T>
    class Signal {
    public:
        using value_type = T;

        Signal(ReadSignal<T> signal) : _runtime{signal.runtime()}, _get{[signal] { return signal.get(); }} {}

        Signal(RwSignal<T> signal) : _runtime{signal.runtime()}, _get{[signal] { return signal.get(); }} {}

        Signal(Memo<T> memo) : _runtime{memo.runtime()}, _get{[memo] { return memo.get(); }} {}

        template<typename F>
            requires std::invocable<F &> && std::convertible_to<std::invoke_result_t<F &>, T>
        static Signal derive(Runtime &rt, F fn) {
            return Signal{&rt, std::function<T()>{std::move(fn)}};
        }

        [[nodiscard]] T get() const { return _get(); }

        [[nodiscard]] T get_untracked() const { return _runtime->untrack(_get); }

        [[nodiscard]] T operator()() const { return get(); }

        template<typename Fn>
        auto with(Fn &&fn) const {
            auto value = get();
            return std::invoke(std::forward<Fn>(fn), std::as_const(value));
        }

    private:
        Signal(runtime_ptr runtime, std::function<T()> get) : _runtime{runtime}, _get{std::move(get)} {}

        runtime_ptr _runtime;
        std::function<T()> _get;
    };
} // namespace reflow

#endif  // REFLOW_API_DERIVED_SIGNAL_H

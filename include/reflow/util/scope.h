#ifndef REFLOW_UTIL_SCOPE_H
#define REFLOW_UTIL_SCOPE_H

#include <type_traits>
#include <utility>

namespace reflow {
    /**
     * Runs an exit action when the guard leaves scope, on return and on unwind alike.
     * The action must not raise; code whose exit path runs user callbacks uses try / catch instead.
     */
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)) {}

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        ~scope_exit() noexcept { fn_(); }

    private:
        F fn_;
    };

    template<class F>
    [[nodiscard]] scope_exit<std::decay_t<F>> make_scope_exit(F &&f) {
        return scope_exit<std::decay_t<F>>(std::forward<F>(f));
    }

    // Puts target back to its current value when the guard leaves scope
    template<class T>
    [[nodiscard]] auto restore_on_exit(T &target) {
        return make_scope_exit([&target, saved = target]() noexcept { target = saved; });
    }
} // namespace reflow
#endif  // REFLOW_UTIL_SCOPE_H

#ifndef REFLOW_API_MEMO_H
#define REFLOW_API_MEMO_H

#include <reflow/api/handle.h>

#include <concepts>

namespace reflow {
    namespace detail {
        /**
         * Recomputes a memo value and reports a change only when the new value differs from the previous one.
         * The closure may take the previous value as a pointer, null on the first run.
         */
        template<typename T, typename F>
        struct MemoComputation final : Computation {
            explicit MemoComputation(F fn_) : fn{std::move(fn_)} {}

            bool run(ValueCell &cell) override {
                std::optional<T> next;
                {
                    auto reading = cell.borrow();
                    const T *previous = std::as_const(cell.value).template get_if<T>();
                    if constexpr (std::invocable<F &, const T *>) {
                        next.emplace(std::invoke(fn, previous));
                    } else {
                        next.emplace(std::invoke(fn));
                    }
                    if (previous != nullptr && *previous == *next) { return false; }
                }
                auto writing = cell.borrow_mut();
                cell.value.template emplace<T>(std::move(*next));
                return true;
            }

            F fn;
        };
    } // namespace detail

    /**
     * A derived value, recomputed lazily when read after one of its sources changed.
     */
    template<typename T>
    class Memo : public Readable<T> {
    public:
        using Readable<T>::Readable;
    };

    template<typename F>
        requires std::invocable<F &> && std::equality_comparable<std::decay_t<std::invoke_result_t<F &>>>
    Memo<std::decay_t<std::invoke_result_t<F &>>> create_memo(Runtime &rt, F fn) {
        using T = std::decay_t<std::invoke_result_t<F &>>;
        auto id = rt.create_memo_node(std::make_shared<detail::MemoComputation<T, F>>(std::move(fn)));
        return Memo<T>{&rt, id};
    }

    // Form taking the previous value: fn(const T *previous) -> T
    template<typename T, typename F>
        requires std::equality_comparable<T> && (std::invocable<F &, const T *> || std::invocable<F &>)
    Memo<T> create_memo(Runtime &rt, F fn) {
        auto id = rt.create_memo_node(std::make_shared<detail::MemoComputation<T, F>>(std::move(fn)));
        return Memo<T>{&rt, id};
    }
} // namespace reflow

#endif  // REFLOW_API_MEMO_H

#ifndef REFLOW_API_EFFECT_H
#define REFLOW_API_EFFECT_H

#include <reflow/api/handle.h>

namespace reflow {
    namespace detail {
        // Effects always report a change, they have no subscribers to spare
        template<typename T, typename F>
        struct EffectComputation final : Computation {
            explicit EffectComputation(F fn_) : fn{std::move(fn_)} {}

            bool run(ValueCell &cell) override {
                if constexpr (std::is_void_v<T>) {
                    std::invoke(fn);
                } else {
                    std::optional<T> previous;
                    {
                        auto writing = cell.borrow_mut();
                        if (auto *value = cell.value.template get_if<T>()) { previous.emplace(std::move(*value)); }
                        cell.value.reset();
                    }
                    T next = std::invoke(fn, std::move(previous));
                    auto writing = cell.borrow_mut();
                    cell.value.template emplace<T>(std::move(next));
                }
                return true;
            }

            F fn;
        };
    } // namespace detail

    class REFLOW_EXPORT Effect : public NodeHandle {
    public:
        using NodeHandle::NodeHandle;

        /**
         * The value returned by the last run of an effect created with a previous-value closure.
         */
        template<typename T>
        [[nodiscard]] std::optional<T> value() const {
            auto cell = _runtime != nullptr ? _runtime->try_value_cell(_id, false) : nullptr;
            if (!cell) { return std::nullopt; }
            auto reading = cell->borrow();
            if (auto *value = std::as_const(cell->value).template get_if<T>()) { return *value; }
            return std::nullopt;
        }
    };

    /**
     * Runs fn now and again whenever anything it read changes.
     */
    template<typename F>
        requires std::invocable<F &>
    Effect create_effect(Runtime &rt, F fn) {
        return Effect{&rt, rt.create_effect_node(std::make_shared<detail::EffectComputation<void, F>>(std::move(fn)))};
    }

    // Form threading a value between runs: fn(std::optional<T> previous) -> T
    template<typename T, typename F>
        requires std::invocable<F &, std::optional<T>>
    Effect create_effect(Runtime &rt, F fn) {
        return Effect{&rt, rt.create_effect_node(std::make_shared<detail::EffectComputation<T, F>>(std::move(fn)))};
    }
} // namespace reflow

#endif  // REFLOW_API_EFFECT_H

#ifndef REFLOW_API_STORED_VALUE_H
#define REFLOW_API_STORED_VALUE_H

#include <reflow/api/handle.h>

namespace reflow {
    /**
     * A non-reactive value owned by a scope. Reads and writes never touch the graph, the value is dropped when the
     * owning scope is disposed.
     */
    template<typename T>
    class StoredValue {
    public:
        using value_type = T;

        StoredValue() = default;

        StoredValue(runtime_ptr runtime, StoredValueId id) : _runtime{runtime}, _id{id} {}

        [[nodiscard]] StoredValueId id() const noexcept { return _id; }

        [[nodiscard]] bool is_disposed() const noexcept {
            return _runtime == nullptr || _runtime->try_stored_cell(_id) == nullptr;
        }

        [[nodiscard]] T get() const { return with([](const T &value) { return value; }); }

        template<typename Fn>
        decltype(auto) with(Fn &&fn) const {
            return detail::read_cell<T>(cell(), std::forward<Fn>(fn));
        }

        void set(T value) const {
            update([&value](T &current) { current = std::move(value); });
        }

        template<typename Fn>
        decltype(auto) update(Fn &&fn) const {
            return detail::write_cell<T>(cell(), std::forward<Fn>(fn));
        }

        [[nodiscard]] std::optional<T> try_get() const {
            auto stored = try_cell();
            if (!stored) { return std::nullopt; }
            return detail::read_cell<T>(stored, [](const T &value) { return value; });
        }

        std::optional<T> try_set(T value) const {
            auto stored = try_cell();
            if (!stored) { return std::optional<T>{std::move(value)}; }
            detail::write_cell<T>(stored, [&value](T &current) { current = std::move(value); });
            return std::nullopt;
        }

        template<typename Fn>
        auto try_update(Fn &&fn) const -> detail::try_result_t<std::invoke_result_t<Fn, T &>> {
            auto stored = try_cell();
            if constexpr (std::is_void_v<std::invoke_result_t<Fn, T &>>) {
                if (!stored) { return false; }
                detail::write_cell<T>(stored, std::forward<Fn>(fn));
                return true;
            } else {
                if (!stored) { return std::nullopt; }
                return detail::write_cell<T>(stored, std::forward<Fn>(fn));
            }
        }

    private:
        [[nodiscard]] value_cell_s_ptr cell() const {
            if (_runtime == nullptr) { throw_error<DisposedError>("Stored value is not bound to a runtime"); }
            return _runtime->stored_cell(_id);
        }

        [[nodiscard]] value_cell_s_ptr try_cell() const {
            return _runtime != nullptr ? _runtime->try_stored_cell(_id) : nullptr;
        }

        runtime_ptr _runtime{nullptr};
        StoredValueId _id;
    };

    template<typename T>
    StoredValue<std::decay_t<T>> store_value(Runtime &rt, T &&value) {
        using V = std::decay_t<T>;
        return StoredValue<V>{&rt, rt.store_value(AnyValue::make<V>(std::forward<T>(value)))};
    }
} // namespace reflow

#endif  // REFLOW_API_STORED_VALUE_H

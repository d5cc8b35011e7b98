#ifndef REFLOW_API_SIGNAL_H
#define REFLOW_API_SIGNAL_H

#include <reflow/api/handle.h>

namespace reflow {
    template<typename T>
    class ReadSignal : public Readable<T> {
    public:
        using Readable<T>::Readable;
    };

    /**
     * The write half of a signal. Writes never compare values: every set/update propagates.
     */
    template<typename T>
    class WriteSignal : public NodeHandle {
    public:
        using value_type = T;
        using NodeHandle::NodeHandle;

        void set(T value) const {
            update([&value](T &current) { current = std::move(value); });
        }

        template<typename Fn>
        void update(Fn &&fn) const {
            update_untracked(std::forward<Fn>(fn));
            _runtime->notify_changed(_id);
        }

        // Writes without notifying subscribers
        void set_untracked(T value) const {
            update_untracked([&value](T &current) { current = std::move(value); });
        }

        template<typename Fn>
        void update_untracked(Fn &&fn) const {
            detail::write_cell<T>(rt().writable_cell(_id), std::forward<Fn>(fn));
        }

        /**
         * Hands the value back if the signal has been disposed.
         */
        std::optional<T> try_set(T value) const {
            auto cell = _runtime != nullptr ? _runtime->try_writable_cell(_id) : nullptr;
            if (!cell) { return std::optional<T>{std::move(value)}; }
            detail::write_cell<T>(cell, [&value](T &current) { current = std::move(value); });
            _runtime->notify_changed(_id);
            return std::nullopt;
        }

        template<typename Fn>
        auto try_update(Fn &&fn) const -> detail::try_result_t<std::invoke_result_t<Fn, T &>> {
            using R = std::invoke_result_t<Fn, T &>;
            auto cell = _runtime != nullptr ? _runtime->try_writable_cell(_id) : nullptr;
            if constexpr (std::is_void_v<R>) {
                if (!cell) { return false; }
                detail::write_cell<T>(cell, std::forward<Fn>(fn));
                _runtime->notify_changed(_id);
                return true;
            } else {
                if (!cell) { return std::nullopt; }
                std::optional<std::decay_t<R>> result{detail::write_cell<T>(cell, std::forward<Fn>(fn))};
                _runtime->notify_changed(_id);
                return result;
            }
        }

        void operator()(T value) const { set(std::move(value)); }
    };

    /**
     * Read and write access over the same signal.
     */
    template<typename T>
    class RwSignal : public Readable<T> {
    public:
        using Readable<T>::Readable;

        [[nodiscard]] ReadSignal<T> read_only() const { return ReadSignal<T>{this->_runtime, this->_id}; }

        [[nodiscard]] WriteSignal<T> write_only() const { return WriteSignal<T>{this->_runtime, this->_id}; }

        [[nodiscard]] std::pair<ReadSignal<T>, WriteSignal<T>> split() const { return {read_only(), write_only()}; }

        void set(T value) const { write_only().set(std::move(value)); }

        template<typename Fn>
        void update(Fn &&fn) const { write_only().update(std::forward<Fn>(fn)); }

        void set_untracked(T value) const { write_only().set_untracked(std::move(value)); }

        template<typename Fn>
        void update_untracked(Fn &&fn) const { write_only().update_untracked(std::forward<Fn>(fn)); }

        std::optional<T> try_set(T value) const { return write_only().try_set(std::move(value)); }

        template<typename Fn>
        auto try_update(Fn &&fn) const { return write_only().try_update(std::forward<Fn>(fn)); }
    };

    template<typename T>
    std::pair<ReadSignal<std::decay_t<T>>, WriteSignal<std::decay_t<T>>> create_signal(Runtime &rt, T &&initial) {
        using V = std::decay_t<T>;
        auto id = rt.create_signal_node(AnyValue::make<V>(std::forward<T>(initial)));
        return {ReadSignal<V>{&rt, id}, WriteSignal<V>{&rt, id}};
    }

    template<typename T>
    RwSignal<std::decay_t<T>> create_rw_signal(Runtime &rt, T &&initial) {
        using V = std::decay_t<T>;
        return RwSignal<V>{&rt, rt.create_signal_node(AnyValue::make<V>(std::forward<T>(initial)))};
    }
} // namespace reflow

#endif  // REFLOW_API_SIGNAL_H

#ifndef REFLOW_API_HANDLE_H
#define REFLOW_API_HANDLE_H

#include <reflow/runtime/runtime.h>
#include <reflow/types/error_type.h>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace reflow {
    namespace detail {
        template<typename T, typename Fn>
        decltype(auto) read_cell(const value_cell_s_ptr &cell, Fn &&fn) {
            auto reading = cell->borrow();
            return std::invoke(std::forward<Fn>(fn), std::as_const(cell->value).template as<T>());
        }

        template<typename T, typename Fn>
        decltype(auto) write_cell(const value_cell_s_ptr &cell, Fn &&fn) {
            auto writing = cell->borrow_mut();
            return std::invoke(std::forward<Fn>(fn), cell->value.template as<T>());
        }

        // try_ variants report a missing node as an empty optional, or false when there is no result to wrap
        template<typename R>
        using try_result_t = std::conditional_t<std::is_void_v<R>, bool, std::optional<std::decay_t<R>>>;
    } // namespace detail

    /**
     * The common part of every node handle: a runtime back-pointer and a NodeId.
     *
     * Handles are trivially copyable and own nothing, the node lives until its scope is disposed (or dispose() is
     * called on any copy of the handle).
     */
    class REFLOW_EXPORT NodeHandle {
    public:
        NodeHandle() = default;

        NodeHandle(runtime_ptr runtime, NodeId id) : _runtime{runtime}, _id{id} {}

        [[nodiscard]] NodeId id() const noexcept { return _id; }

        [[nodiscard]] runtime_ptr runtime() const noexcept { return _runtime; }

        [[nodiscard]] bool is_disposed() const noexcept { return _runtime == nullptr || !_runtime->contains(_id); }

        void set_label(std::string label) const { rt().set_label(_id, std::move(label)); }

        void dispose() const {
            if (_runtime != nullptr) { _runtime->dispose_node(_id); }
        }

        bool operator==(const NodeHandle &) const = default;

    protected:
        [[nodiscard]] Runtime &rt() const {
            if (_runtime == nullptr) { throw_error<DisposedError>("Handle is not bound to a runtime"); }
            return *_runtime;
        }

        runtime_ptr _runtime{nullptr};
        NodeId _id;
    };

    /**
     * Read access shared by ReadSignal, RwSignal and Memo.
     */
    template<typename T>
    class Readable : public NodeHandle {
    public:
        using value_type = T;
        using NodeHandle::NodeHandle;

        // Tracked read, clones the value
        [[nodiscard]] T get() const { return with([](const T &value) { return value; }); }

        [[nodiscard]] T get_untracked() const { return with_untracked([](const T &value) { return value; }); }

        [[nodiscard]] T operator()() const { return get(); }

        template<typename Fn>
        decltype(auto) with(Fn &&fn) const {
            return detail::read_cell<T>(rt().value_cell(_id, true), std::forward<Fn>(fn));
        }

        template<typename Fn>
        decltype(auto) with_untracked(Fn &&fn) const {
            return detail::read_cell<T>(rt().value_cell(_id, false), std::forward<Fn>(fn));
        }

        [[nodiscard]] std::optional<T> try_get() const {
            return try_with([](const T &value) { return value; });
        }

        [[nodiscard]] std::optional<T> try_get_untracked() const {
            return try_with_untracked([](const T &value) { return value; });
        }

        template<typename Fn>
        auto try_with(Fn &&fn) const -> detail::try_result_t<std::invoke_result_t<Fn, const T &>> {
            return try_read(true, std::forward<Fn>(fn));
        }

        template<typename Fn>
        auto try_with_untracked(Fn &&fn) const -> detail::try_result_t<std::invoke_result_t<Fn, const T &>> {
            return try_read(false, std::forward<Fn>(fn));
        }

    private:
        template<typename Fn>
        auto try_read(bool track, Fn &&fn) const -> detail::try_result_t<std::invoke_result_t<Fn, const T &>> {
            using R = std::invoke_result_t<Fn, const T &>;
            auto cell = _runtime != nullptr ? _runtime->try_value_cell(_id, track) : nullptr;
            if constexpr (std::is_void_v<R>) {
                if (!cell) { return false; }
                detail::read_cell<T>(cell, std::forward<Fn>(fn));
                return true;
            } else {
                if (!cell) { return std::nullopt; }
                return detail::read_cell<T>(cell, std::forward<Fn>(fn));
            }
        }
    };
} // namespace reflow

#endif  // REFLOW_API_HANDLE_H

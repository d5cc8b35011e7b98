#ifndef REFLOW_API_SCOPE_H
#define REFLOW_API_SCOPE_H

#include <reflow/runtime/runtime.h>
#include <reflow/types/error_type.h>

#include <type_traits>

namespace reflow {
    /**
     * A handle on a disposal boundary. Nodes, stored values, contexts and cleanups registered while a scope is
     * current belong to it and go away with it.
     */
    struct REFLOW_EXPORT Scope {
        Scope() = default;

        Scope(runtime_ptr runtime, ScopeId id) : _runtime{runtime}, _id{id} {}

        [[nodiscard]] ScopeId id() const noexcept { return _id; }

        [[nodiscard]] runtime_ptr runtime() const noexcept { return _runtime; }

        [[nodiscard]] bool is_disposed() const noexcept { return _runtime == nullptr || !_runtime->is_scope_alive(_id); }

        [[nodiscard]] std::optional<Scope> parent() const {
            auto parent = rt().scope_parent(_id);
            if (!parent) { return std::nullopt; }
            return Scope{_runtime, *parent};
        }

        // Creates a nested scope, disposed with this one
        [[nodiscard]] Scope child() const { return Scope{_runtime, rt().create_scope(_id)}; }

        /**
         * Runs fn with this scope current.
         */
        template<typename Fn>
        decltype(auto) run(Fn &&fn) const {
            if (is_disposed()) { throw_error<DisposedError>(fmt::format("Scope {} has been disposed", _id)); }
            return _runtime->with_owner(_id, std::forward<Fn>(fn));
        }

        void on_cleanup(std::function<void()> cleanup) const { rt().on_cleanup(_id, std::move(cleanup)); }

        void dispose() const {
            if (_runtime != nullptr) { _runtime->dispose_scope(_id); }
        }

        bool operator==(const Scope &) const = default;

    private:
        [[nodiscard]] Runtime &rt() const {
            if (_runtime == nullptr) { throw_error<DisposedError>("Scope is not bound to a runtime"); }
            return *_runtime;
        }

        runtime_ptr _runtime{nullptr};
        ScopeId _id;
    };

    [[nodiscard]] inline Scope current_scope(Runtime &rt) { return Scope{&rt, rt.current_scope()}; }

    // A new child of the current scope
    [[nodiscard]] inline Scope create_scope(Runtime &rt) { return Scope{&rt, rt.create_scope(rt.current_scope())}; }

    /**
     * Runs fn(scope) in a fresh child scope and disposes the scope afterwards, also when fn raises.
     */
    template<typename Fn>
        requires std::invocable<Fn &, Scope>
    decltype(auto) run_scope(Runtime &rt, Fn &&fn) {
        auto scope = create_scope(rt);
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn &, Scope>>) {
                scope.run([&] { fn(scope); });
                scope.dispose();
            } else {
                auto result = scope.run([&] { return fn(scope); });
                scope.dispose();
                return result;
            }
        } catch (...) {
            scope.dispose();
            throw;
        }
    }

    // Registers fn to run when the current scope is disposed
    inline void on_cleanup(Runtime &rt, std::function<void()> cleanup) {
        rt.on_cleanup(rt.current_scope(), std::move(cleanup));
    }
} // namespace reflow

#endif  // REFLOW_API_SCOPE_H

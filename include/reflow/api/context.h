#ifndef REFLOW_API_CONTEXT_H
#define REFLOW_API_CONTEXT_H

#include <reflow/runtime/runtime.h>
#include <reflow/types/error_type.h>

#include <typeindex>

namespace reflow {
    /**
     * Makes value visible to use_context<T> calls in the current scope and its descendants, replacing a value of
     * the same type already provided by this scope.
     */
    template<typename T>
    void provide_context(Runtime &rt, T value) {
        rt.provide_context(std::type_index{typeid(T)}, AnyValue::make<T>(std::move(value)));
    }

    template<typename T>
    [[nodiscard]] std::optional<T> try_use_context(Runtime &rt) {
        if (const auto *value = rt.find_context(std::type_index{typeid(T)})) { return value->template as<T>(); }
        return std::nullopt;
    }

    template<typename T>
    [[nodiscard]] T use_context(Runtime &rt) {
        if (auto value = try_use_context<T>(rt)) { return std::move(*value); }
        throw_error<MissingContextError>(
            fmt::format("No context of type {} provided in scope {} or its ancestors", typeid(T).name(),
                        rt.current_scope()));
    }
} // namespace reflow

#endif  // REFLOW_API_CONTEXT_H

#include <reflow/runtime/scope_tree.h>
#include <reflow/types/error_type.h>

#include <algorithm>

namespace reflow {
    ScopeTree::ScopeTree() : _root{_scopes.insert(ScopeState{ScopeId{}})} {}

    ScopeId ScopeTree::create(ScopeId parent) {
        if (!_scopes.contains(parent)) {
            throw_error<DisposedError>(fmt::format("Cannot create a child of disposed scope {}", parent));
        }
        auto id = _scopes.insert(ScopeState{parent});
        // The insert may have grown the arena, resolve the parent afterwards
        get(parent).children.push_back(id);
        return id;
    }

    ScopeState &ScopeTree::get(ScopeId id) {
        if (auto *state = _scopes.get(id)) { return *state; }
        throw_error<DisposedError>(fmt::format("Scope {} has been disposed", id));
    }

    std::optional<ScopeState> ScopeTree::remove(ScopeId id) {
        auto state = _scopes.remove(id);
        if (!state) { return std::nullopt; }
        if (auto *parent = _scopes.get(state->parent)) {
            auto &siblings = parent->children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
        }
        return state;
    }

    const AnyValue *ScopeTree::find_context(ScopeId id, const std::type_index &type) {
        auto *state = _scopes.get(id);
        while (state != nullptr) {
            if (auto it = state->contexts.find(type); it != state->contexts.end()) { return &it->second; }
            state = _scopes.get(state->parent);
        }
        return nullptr;
    }

    StoredValueId ScopeTree::store(ScopeId owner, AnyValue value) {
        if (!_scopes.contains(owner)) {
            throw_error<DisposedError>(fmt::format("Cannot store a value in disposed scope {}", owner));
        }
        auto id = _stored.insert(std::make_shared<ValueCell>(std::move(value)));
        get(owner).stored_values.push_back(id);
        return id;
    }

    value_cell_s_ptr ScopeTree::stored_cell(StoredValueId id) {
        if (auto *cell = _stored.get(id)) { return *cell; }
        throw_error<DisposedError>(fmt::format("Stored value {} has been disposed", id));
    }

    value_cell_s_ptr ScopeTree::try_stored_cell(StoredValueId id) noexcept {
        if (auto *cell = _stored.get(id)) { return *cell; }
        return nullptr;
    }

    void ScopeTree::dispose_stored(StoredValueId id) { _stored.remove(id); }
} // namespace reflow

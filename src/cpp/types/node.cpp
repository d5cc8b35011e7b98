#include <reflow/types/error_type.h>
#include <reflow/types/node.h>

namespace reflow {
    std::string_view to_string(NodeKind kind) noexcept {
        switch (kind) {
            case NodeKind::SIGNAL: return "signal";
            case NodeKind::MEMO: return "memo";
            case NodeKind::EFFECT: return "effect";
            case NodeKind::TRIGGER: return "trigger";
        }
        return "unknown";
    }

    std::string_view to_string(NodeState state) noexcept {
        switch (state) {
            case NodeState::CLEAN: return "clean";
            case NodeState::CHECK: return "check";
            case NodeState::DIRTY: return "dirty";
        }
        return "unknown";
    }

    ValueCell::ValueCell(AnyValue value_) : value{std::move(value_)} {}

    ValueCell::ReadBorrow::ReadBorrow(ValueCell &cell) : _cell{cell} {
        if (_cell._writing) {
            throw_error<BorrowConflictError>("Cannot read a reactive value while it is being updated");
        }
        ++_cell._readers;
    }

    ValueCell::ReadBorrow::~ReadBorrow() { --_cell._readers; }

    ValueCell::WriteBorrow::WriteBorrow(ValueCell &cell) : _cell{cell} {
        if (_cell._writing) {
            throw_error<BorrowConflictError>("Cannot update a reactive value that is already being updated");
        }
        if (_cell._readers > 0) {
            throw_error<BorrowConflictError>("Cannot update a reactive value while {} reader(s) hold it",
                                             _cell._readers);
        }
        _cell._writing = true;
    }

    ValueCell::WriteBorrow::~WriteBorrow() { _cell._writing = false; }

    ReactiveNode::ReactiveNode(NodeKind kind_, NodeState state_, ValueCell::s_ptr value_, Computation::s_ptr compute_,
                               ScopeId owner_)
        : kind{kind_}, state{state_}, value{std::move(value_)}, compute{std::move(compute_)}, owner{owner_} {}

    std::string NodeInfo::name() const {
        if (label.empty()) { return fmt::format("{}<{}>", kind, id); }
        return fmt::format("{}<{}>:{}", kind, id, label);
    }
} // namespace reflow

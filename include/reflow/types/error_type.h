#ifndef REFLOW_ERROR_TYPE_H
#define REFLOW_ERROR_TYPE_H

#include <reflow/reflow_base.h>
#include <reflow/types/node.h>

#include <exception>
#include <stdexcept>

namespace reflow {
    /**
     * Base of every error raised by the reactive engine.
     */
    struct REFLOW_EXPORT ReactiveError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A handle's generation no longer matches its arena slot: the node, scope or stored value was disposed.
     */
    struct REFLOW_EXPORT DisposedError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    /**
     * Re-entrant access to a value cell that the engine cannot serve without observing a half-updated value, for
     * example writing a Signal from inside a Memo computation that already read it, or a Memo reading itself.
     */
    struct REFLOW_EXPORT BorrowConflictError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    /**
     * use_context found no value of the requested type in the current scope or any of its ancestors.
     */
    struct REFLOW_EXPORT MissingContextError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    /**
     * A Memo or Effect computation raised an exception. Carries the failing node and the original message.
     */
    struct REFLOW_EXPORT ComputeError : ReactiveError {
        ComputeError(NodeInfo node_, std::string error_msg_, std::string additional_context_);

        NodeInfo node;
        std::string error_msg;
        std::string additional_context;

        [[nodiscard]] std::string to_string() const;

        static ComputeError capture_error(const std::exception &e, const NodeInfo &node, const std::string &msg = "");

        static ComputeError capture_error(std::exception_ptr e, const NodeInfo &node, const std::string &msg = "");
    };
} // namespace reflow

#endif  // REFLOW_ERROR_TYPE_H

#include <reflow/types/error_type.h>

namespace reflow {
    namespace {
        std::string compose_message(const NodeInfo &node, const std::string &error_msg,
                                    const std::string &additional_context) {
            if (additional_context.empty()) { return fmt::format("{} failed: {}", node.name(), error_msg); }
            return fmt::format("{} failed ({}): {}", node.name(), additional_context, error_msg);
        }
    } // namespace

    ComputeError::ComputeError(NodeInfo node_, std::string error_msg_, std::string additional_context_)
        : ReactiveError{compose_message(node_, error_msg_, additional_context_)}, node{std::move(node_)},
          error_msg{std::move(error_msg_)}, additional_context{std::move(additional_context_)} {}

    std::string ComputeError::to_string() const { return what(); }

    ComputeError ComputeError::capture_error(const std::exception &e, const NodeInfo &node, const std::string &msg) {
        return ComputeError{node, e.what(), msg};
    }

    ComputeError ComputeError::capture_error(std::exception_ptr e, const NodeInfo &node, const std::string &msg) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception &ex) {
                return capture_error(ex, node, msg);
            } catch (...) {
                return ComputeError{node, "Unknown non-standard exception", msg};
            }
        }
        return ComputeError{node, "Unknown error", msg};
    }
} // namespace reflow

#ifndef REFLOW_RUNTIME_TRACE_H
#define REFLOW_RUNTIME_TRACE_H

#include <reflow/runtime/observers/runtime_observer.h>

#include <iosfwd>
#include <optional>
#include <string>

namespace reflow {

    /**
     * @brief Logs out the different steps as the runtime propagates changes.
     *
     * This is voluminous but can be helpful tracing down unexpected behaviour, such as an effect running more often
     * than expected or a memo that never settles.
     */
    class REFLOW_EXPORT RuntimeTrace : public RuntimeObserver {
    public:
        /**
         * @brief Construct a new Runtime Trace object
         *
         * @param filter Used to restrict which node events to report (substring match on the node name)
         * @param node Log node creation, disposal and runs
         * @param propagation Log writes, queued effects and effect passes
         * @param scope Log scope creation and disposal
         * @param out Where to write, std::cerr when null
         */
        explicit RuntimeTrace(const std::optional<std::string> &filter = std::nullopt, bool node = true,
                              bool propagation = true, bool scope = true, std::ostream *out = nullptr);

        void on_node_created(const NodeInfo &node) override;
        void on_node_disposed(const NodeInfo &node) override;
        void on_signal_write(const NodeInfo &node) override;
        void on_effect_queued(const NodeInfo &node) override;
        void on_before_node_run(const NodeInfo &node) override;
        void on_after_node_run(const NodeInfo &node, bool changed) override;
        void on_before_run_effects(std::size_t queued) override;
        void on_after_run_effects() override;
        void on_scope_created(ScopeId scope) override;
        void on_scope_disposed(ScopeId scope) override;

    private:
        std::optional<std::string> _filter;
        bool _node;
        bool _propagation;
        bool _scope;
        std::ostream *_out;
        std::size_t _pass{0};
        std::size_t _depth{0};

        void _print(const std::string &msg) const;
        void _print_node(const NodeInfo &node, const std::string &msg) const;
        bool _should_log_node(const NodeInfo &node) const;
    };

} // namespace reflow

#endif  // REFLOW_RUNTIME_TRACE_H

#ifndef REFLOW_RUNTIME_PROFILER_H
#define REFLOW_RUNTIME_PROFILER_H

#include <reflow/runtime/observers/runtime_observer.h>

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <iosfwd>
#include <string>

namespace reflow {

    /**
     * @brief Collects run counts and timings per node, can help trace down hot or over-notified computations.
     */
    class REFLOW_EXPORT RuntimeProfiler : public RuntimeObserver {
    public:
        using clock = std::chrono::steady_clock;

        struct NodeStats {
            std::string name;
            NodeKind kind{NodeKind::SIGNAL};
            std::size_t runs{0};
            std::size_t changes{0};
            std::size_t writes{0};
            clock::duration total_time{0};
        };

        void on_signal_write(const NodeInfo &node) override;
        void on_before_node_run(const NodeInfo &node) override;
        void on_after_node_run(const NodeInfo &node, bool changed) override;
        void on_before_run_effects(std::size_t queued) override;

        [[nodiscard]] const NodeStats *stats(NodeId id) const;

        [[nodiscard]] std::size_t passes() const noexcept { return _passes; }

        [[nodiscard]] std::size_t total_runs() const noexcept;

        void reset();

        /**
         * Writes one line per profiled node, most expensive first, followed by the peak resident memory.
         */
        void print_summary(std::ostream &out) const;

        void print_summary() const;

        // Peak resident set size of the process in bytes, 0 where it cannot be read
        [[nodiscard]] static std::size_t peak_memory_usage();

    private:
        NodeStats &_stats_for(const NodeInfo &node);

        ankerl::unordered_dense::map<NodeId, NodeStats> _stats;
        std::vector<clock::time_point> _started;
        std::size_t _passes{0};
    };

} // namespace reflow

#endif  // REFLOW_RUNTIME_PROFILER_H

#include <reflow/runtime/observers/runtime_profiler.h>

#include <fmt/format.h>

#include <algorithm>
#include <iostream>

#if defined(__linux__) || defined(__APPLE__)
#include <sys/resource.h>
#endif

namespace reflow {

    RuntimeProfiler::NodeStats &RuntimeProfiler::_stats_for(const NodeInfo &node) {
        auto &stats = _stats[node.id];
        stats.name = node.name();
        stats.kind = node.kind;
        return stats;
    }

    void RuntimeProfiler::on_signal_write(const NodeInfo &node) { ++_stats_for(node).writes; }

    void RuntimeProfiler::on_before_node_run(const NodeInfo &) { _started.push_back(clock::now()); }

    void RuntimeProfiler::on_after_node_run(const NodeInfo &node, bool changed) {
        auto &stats = _stats_for(node);
        ++stats.runs;
        if (changed) { ++stats.changes; }
        if (!_started.empty()) {
            stats.total_time += clock::now() - _started.back();
            _started.pop_back();
        }
    }

    void RuntimeProfiler::on_before_run_effects(std::size_t) { ++_passes; }

    const RuntimeProfiler::NodeStats *RuntimeProfiler::stats(NodeId id) const {
        auto it = _stats.find(id);
        return it == _stats.end() ? nullptr : &it->second;
    }

    std::size_t RuntimeProfiler::total_runs() const noexcept {
        std::size_t total{0};
        for (const auto &[id, stats] : _stats) { total += stats.runs; }
        return total;
    }

    void RuntimeProfiler::reset() {
        _stats.clear();
        _started.clear();
        _passes = 0;
    }

    void RuntimeProfiler::print_summary(std::ostream &out) const {
        std::vector<const NodeStats *> ordered;
        ordered.reserve(_stats.size());
        for (const auto &[id, stats] : _stats) { ordered.push_back(&stats); }
        std::sort(ordered.begin(), ordered.end(),
                  [](const NodeStats *lhs, const NodeStats *rhs) { return lhs->total_time > rhs->total_time; });

        out << fmt::format("{:<40} {:>8} {:>8} {:>8} {:>12}\n", "node", "writes", "runs", "changed", "time(us)");
        for (const auto *stats : ordered) {
            auto micros = std::chrono::duration_cast<std::chrono::microseconds>(stats->total_time).count();
            out << fmt::format("{:<40} {:>8} {:>8} {:>8} {:>12}\n", stats->name, stats->writes, stats->runs,
                               stats->changes, micros);
        }
        out << fmt::format("passes: {}, peak memory: {} MB\n", _passes, peak_memory_usage() / (1024 * 1024));
    }

    void RuntimeProfiler::print_summary() const { print_summary(std::cout); }

    std::size_t RuntimeProfiler::peak_memory_usage() {
#if defined(__linux__)
        struct rusage usage;
        getrusage(RUSAGE_SELF, &usage);
        return static_cast<std::size_t>(usage.ru_maxrss) * 1024; // kilobytes to bytes
#elif defined(__APPLE__)
        struct rusage usage;
        getrusage(RUSAGE_SELF, &usage);
        return static_cast<std::size_t>(usage.ru_maxrss); // already bytes
#else
        return 0;
#endif
    }

} // namespace reflow

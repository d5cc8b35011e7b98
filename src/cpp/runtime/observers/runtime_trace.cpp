#include <reflow/runtime/observers/runtime_trace.h>

#include <fmt/format.h>
#include <iostream>

namespace reflow {

    RuntimeTrace::RuntimeTrace(const std::optional<std::string> &filter, bool node, bool propagation, bool scope,
                               std::ostream *out)
        : _filter(filter), _node(node), _propagation(propagation), _scope(scope), _out(out) {}

    void RuntimeTrace::_print(const std::string &msg) const {
        auto &out = _out != nullptr ? *_out : std::cerr;
        out << fmt::format("[pass {}] {}{}", _pass, std::string(_depth * 2, ' '), msg) << std::endl;
    }

    void RuntimeTrace::_print_node(const NodeInfo &node, const std::string &msg) const {
        _print(fmt::format("[{}] {}", node.name(), msg));
    }

    bool RuntimeTrace::_should_log_node(const NodeInfo &node) const {
        if (!_filter.has_value()) { return true; }
        return node.name().find(_filter.value()) != std::string::npos;
    }

    void RuntimeTrace::on_node_created(const NodeInfo &node) {
        if (_node && _should_log_node(node)) { _print_node(node, "Created"); }
    }

    void RuntimeTrace::on_node_disposed(const NodeInfo &node) {
        if (_node && _should_log_node(node)) { _print_node(node, "Disposed"); }
    }

    void RuntimeTrace::on_signal_write(const NodeInfo &node) {
        if (_propagation && _should_log_node(node)) { _print_node(node, "[WRITE]"); }
    }

    void RuntimeTrace::on_effect_queued(const NodeInfo &node) {
        if (_propagation && _should_log_node(node)) { _print_node(node, "Queued"); }
    }

    void RuntimeTrace::on_before_node_run(const NodeInfo &node) {
        if (_node && _should_log_node(node)) { _print_node(node, "[IN]"); }
        ++_depth;
    }

    void RuntimeTrace::on_after_node_run(const NodeInfo &node, bool changed) {
        if (_depth > 0) { --_depth; }
        if (_node && _should_log_node(node)) { _print_node(node, changed ? "[OUT] changed" : "[OUT] unchanged"); }
    }

    void RuntimeTrace::on_before_run_effects(std::size_t queued) {
        ++_pass;
        if (_propagation) {
            _print(fmt::format("{} Run effects ({} queued) {}", std::string(20, '>'), queued, std::string(20, '>')));
        }
    }

    void RuntimeTrace::on_after_run_effects() {
        if (_propagation) { _print(fmt::format("{} Run effects done {}", std::string(20, '<'), std::string(20, '<'))); }
    }

    void RuntimeTrace::on_scope_created(ScopeId scope) {
        if (_scope) { _print(fmt::format("Scope {} created", scope)); }
    }

    void RuntimeTrace::on_scope_disposed(ScopeId scope) {
        if (_scope) { _print(fmt::format("Scope {} disposed", scope)); }
    }

} // namespace reflow

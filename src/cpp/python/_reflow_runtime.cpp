/*
 * Expose the Runtime and its handles to python. Values are held as python objects, memo equality uses python ==.
 */
#include <reflow/reflow.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unique_ptr.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace {
    using namespace reflow;

    using PySignal = RwSignal<nb::object>;
    using PyMemo = Memo<nb::object>;

    struct PyMemoComputation final : Computation {
        explicit PyMemoComputation(nb::callable fn_) : fn{std::move(fn_)} {}

        bool run(ValueCell &cell) override {
            nb::object next = fn();
            {
                auto reading = cell.borrow();
                const auto *previous = std::as_const(cell.value).get_if<nb::object>();
                if (previous != nullptr && previous->equal(next)) { return false; }
            }
            auto writing = cell.borrow_mut();
            cell.value.emplace<nb::object>(std::move(next));
            return true;
        }

        nb::callable fn;
    };

    // The handle methods live on non-registered bases, bind through lambdas on the concrete type
    template<typename Handle>
    void bind_node_handle(nb::class_<Handle> &cls) {
        cls.def_prop_ro("id", [](const Handle &self) { return fmt::format("{}", self.id()); })
            .def("dispose", [](const Handle &self) { self.dispose(); })
            .def("is_disposed", [](const Handle &self) { return self.is_disposed(); })
            .def("set_label", [](const Handle &self, std::string label) { self.set_label(std::move(label)); },
                 "label"_a);
    }

    template<typename Handle>
    void bind_readable(nb::class_<Handle> &cls) {
        cls.def("get", [](const Handle &self) { return self.get(); }, "Tracked read of the current value.")
            .def("get_untracked", [](const Handle &self) { return self.get_untracked(); })
            .def("__call__", [](const Handle &self) { return self.get(); });
    }
} // namespace

void export_handles(nb::module_ &m) {
    using namespace reflow;

    auto signal = nb::class_<PySignal>(m, "Signal", "A writable reactive value.");
    bind_node_handle(signal);
    bind_readable(signal);
    signal.def("set", [](const PySignal &self, nb::object value) { self.set(std::move(value)); }, "value"_a,
               "Replace the value and propagate the change.")
        .def("set_untracked", [](const PySignal &self, nb::object value) { self.set_untracked(std::move(value)); },
             "value"_a)
        .def(
            "update", [](const PySignal &self, nb::callable fn) { self.update([&fn](nb::object &v) { v = fn(v); }); },
            "fn"_a, "Replace the value with fn(value) and propagate the change.");

    auto memo = nb::class_<PyMemo>(m, "Memo", "A derived value, recomputed lazily and compared with ==.");
    bind_node_handle(memo);
    bind_readable(memo);

    auto effect = nb::class_<Effect>(m, "Effect", "A side effect re-run whenever what it read changes.");
    bind_node_handle(effect);

    auto trigger = nb::class_<Trigger>(m, "Trigger", "A dependency without a value.");
    bind_node_handle(trigger);
    trigger.def("track", [](const Trigger &self) { self.track(); })
        .def("notify", [](const Trigger &self) { self.notify(); });

    nb::class_<Scope>(m, "Scope", "A disposal boundary.")
        .def("dispose", &Scope::dispose)
        .def("is_disposed", &Scope::is_disposed)
        .def("child", &Scope::child)
        .def(
            "run", [](const Scope &self, nb::callable fn) -> nb::object { return self.run([&fn] { return fn(); }); },
            "fn"_a, "Run fn with this scope current.")
        .def(
            "on_cleanup", [](const Scope &self, nb::callable fn) { self.on_cleanup([fn] { fn(); }); }, "fn"_a);

    nb::class_<RuntimeObserver>(m, "RuntimeObserver");

    nb::class_<RuntimeTrace, RuntimeObserver>(m, "RuntimeTrace",
                                              "Logs out the different steps as the runtime propagates changes.")
        .def(
            "__init__",
            [](RuntimeTrace *self, const std::optional<std::string> &filter, bool node, bool propagation, bool scope) {
                new (self) RuntimeTrace(filter, node, propagation, scope);
            },
            "filter"_a = std::nullopt, "node"_a = true, "propagation"_a = true, "scope"_a = true);

    nb::class_<RuntimeProfiler, RuntimeObserver>(m, "RuntimeProfiler",
                                                 "Collects run counts and timings per node.")
        .def(nb::init<>())
        .def_prop_ro("passes", &RuntimeProfiler::passes)
        .def_prop_ro("total_runs", &RuntimeProfiler::total_runs)
        .def("reset", &RuntimeProfiler::reset)
        .def("print_summary", nb::overload_cast<>(&RuntimeProfiler::print_summary, nb::const_));
}

void export_runtime(nb::module_ &m) {
    using namespace reflow;

    nb::class_<Runtime>(m, "Runtime", "Owns one reactive graph.")
        .def(
            "__init__",
            [](Runtime *self, bool trace, const std::optional<std::string> &trace_filter) {
                RuntimeConfig config;
                config.trace = trace || trace_filter.has_value();
                config.trace_filter = trace_filter;
                new (self) Runtime(std::move(config));
            },
            "trace"_a = false, "trace_filter"_a = std::nullopt)
        .def_static(
            "from_environment", [] { return std::make_unique<Runtime>(RuntimeConfig::from_environment()); },
            "A Runtime configured from REFLOW_TRACE / REFLOW_TRACE_FILTER.")
        .def(
            "create_signal", [](Runtime &self, nb::object initial) { return create_rw_signal(self, std::move(initial)); },
            "initial"_a, nb::keep_alive<0, 1>())
        .def(
            "create_memo",
            [](Runtime &self, nb::callable fn) {
                return PyMemo{&self, self.create_memo_node(std::make_shared<PyMemoComputation>(std::move(fn)))};
            },
            "fn"_a, nb::keep_alive<0, 1>())
        .def(
            "create_effect", [](Runtime &self, nb::callable fn) { return create_effect(self, [fn] { fn(); }); }, "fn"_a,
            nb::keep_alive<0, 1>())
        .def("create_trigger", [](Runtime &self) { return create_trigger(self); }, nb::keep_alive<0, 1>())
        .def(
            "watch",
            [](Runtime &self, nb::callable deps, nb::callable callback, bool immediate) -> StopFn {
                return watch(
                    self, [deps] { return nb::object(deps()); },
                    [callback](const nb::object &current, const std::optional<nb::object> &previous) {
                        callback(current, previous ? *previous : nb::object(nb::none()));
                    },
                    immediate);
            },
            "deps"_a, "callback"_a, "immediate"_a = false, nb::keep_alive<0, 1>())
        .def(
            "batch", [](Runtime &self, nb::callable fn) -> nb::object { return self.batch([&fn] { return fn(); }); },
            "fn"_a)
        .def(
            "untrack", [](Runtime &self, nb::callable fn) -> nb::object { return self.untrack([&fn] { return fn(); }); },
            "fn"_a)
        .def("create_scope", [](Runtime &self) { return create_scope(self); }, nb::keep_alive<0, 1>())
        .def("current_scope", [](Runtime &self) { return current_scope(self); }, nb::keep_alive<0, 1>())
        .def(
            "on_cleanup", [](Runtime &self, nb::callable fn) { on_cleanup(self, [fn] { fn(); }); }, "fn"_a)
        .def("run_effects", &Runtime::run_effects)
        .def("add_observer", &Runtime::add_observer, "observer"_a)
        .def("remove_observer", &Runtime::remove_observer, "observer"_a)
        .def_prop_ro("node_count", &Runtime::node_count)
        .def_prop_ro("scope_count", &Runtime::scope_count);
}

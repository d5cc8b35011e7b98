/*
 * The entry point into the python _reflow module exposing the C++ runtime to python.
 *
 * Handles returned to python hold a raw pointer to their Runtime, the creating calls keep the Runtime alive for as
 * long as a handle is referenced.
 */
#include <reflow/types/error_type.h>

#include <nanobind/nanobind.h>

namespace nb = nanobind;

void export_runtime(nb::module_ &);

void export_handles(nb::module_ &);

NB_MODULE(_reflow, m) {
    nb::set_leak_warnings(false);
    m.doc() = "The reflow C++ reactive runtime";

    // Translators are tried most recent first, register the base before its subclasses
    auto reactive_error = nb::exception<reflow::ReactiveError>(m, "ReactiveError", PyExc_RuntimeError);
    nb::exception<reflow::DisposedError>(m, "DisposedError", reactive_error);
    nb::exception<reflow::BorrowConflictError>(m, "BorrowConflictError", reactive_error);
    nb::exception<reflow::MissingContextError>(m, "MissingContextError", reactive_error);
    nb::exception<reflow::ComputeError>(m, "ComputeError", reactive_error);

    export_handles(m);
    export_runtime(m);
}

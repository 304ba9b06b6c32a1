/*
 * The entry point into the python _tclinter module exposing the object tree to python.
 *
 * Widgets are owned by the ChildSet of their parent, so python holds them by reference and keeps the parent
 * alive for as long as it does. A widget handle must not be used after destroy().
 */
#include <tclinter/python/python_callbacks.h>
#include <tclinter/util/execution_timer.h>
#include <tclinter/app/self_test.h>

NB_MODULE(_tclinter, m) {
    m.doc() = "Tcl/Tk object tree bindings";

    nb::exception<tclinter::StructuralError>(m, "StructuralError", PyExc_RuntimeError);
    nb::exception<tclinter::InstantiatedError>(m, "InstantiatedError", PyExc_RuntimeError);
    nb::exception<tclinter::LookupError>(m, "LookupError", PyExc_LookupError);
    nb::exception<tclinter::TypeError>(m, "TypeError", PyExc_TypeError);
    nb::exception<tclinter::ValueError>(m, "ValueError", PyExc_ValueError);
    nb::exception<tclinter::BoundsViolation>(m, "BoundsViolation", PyExc_ValueError);
    nb::exception<tclinter::UnsupportedTypeError>(m, "UnsupportedTypeError", PyExc_TypeError);
    nb::exception<tclinter::InterpreterError>(m, "InterpreterError", PyExc_RuntimeError);

    m.def("self_test", &tclinter::run_self_test, "Run the bounds self test, True when it passes");
    m.def("main", &tclinter::tclinter_main);

    export_interpreter(m);
    export_types(m);
    export_tree(m);
}

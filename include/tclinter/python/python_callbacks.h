#ifndef TCLINTER_PYTHON_CALLBACKS_H
#define TCLINTER_PYTHON_CALLBACKS_H

#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <tclinter/types/callback_group.h>
#include <tclinter/types/observers.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace tclinter {
    /**
     * Wrap a Python callable as a command callback. The callable receives the interpreter words as positional
     * str arguments; None maps to no words, a tuple or list to one word per item, anything else to its str().
     */
    Callback to_callback(nb::callable function);

    /**
     * Classify Python keyword arguments: a callable, or a list/tuple made only of callables, becomes a callback
     * group named after the callable; everything else becomes a flag value (a tuple or list giving one token
     * per item).
     * @throws UnsupportedTypeError for an empty list or tuple
     */
    Options to_options(const nb::kwargs &kwargs);

    /**
     * Wrap a Python callable as an observer of a Value; None results map to std::nullopt.
     */
    Observers<Value>::observer_type to_observer(nb::callable observer);

    nb::tuple to_tuple(const Tokens &tokens);
} // namespace tclinter

void export_interpreter(nb::module_ &);

void export_types(nb::module_ &);

void export_tree(nb::module_ &);

#endif // TCLINTER_PYTHON_CALLBACKS_H

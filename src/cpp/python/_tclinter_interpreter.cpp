#include <tclinter/interpreter/command_trace.h>
#include <tclinter/interpreter/tcl_interpreter.h>
#include <tclinter/python/python_callbacks.h>

void export_interpreter(nb::module_ &m) {
    using namespace tclinter;

    nb::class_<InterpreterOptions>(m, "InterpreterOptions")
        .def(nb::init<>())
        .def_rw("screen_name", &InterpreterOptions::screen_name)
        .def_rw("base_name", &InterpreterOptions::base_name)
        .def_rw("class_name", &InterpreterOptions::class_name)
        .def_rw("interactive", &InterpreterOptions::interactive)
        .def_rw("want_objects", &InterpreterOptions::want_objects)
        .def_rw("init_tk", &InterpreterOptions::init_tk)
        .def_rw("sync", &InterpreterOptions::sync)
        .def_rw("use", &InterpreterOptions::use);

    nb::class_<CommandTracer>(m, "CommandTracer");

    nb::class_<CommandTrace, CommandTracer>(m, "CommandTrace")
        .def(nb::init<const std::optional<std::string> &, bool, bool, bool>(), "filter"_a = nb::none(),
             "before"_a = true, "after"_a = true, "failed"_a = true)
        .def_prop_ro("call_count", &CommandTrace::call_count)
        .def_static("set_use_logger", &CommandTrace::set_use_logger, "value"_a);

    nb::class_<Interpreter>(m, "Interpreter")
        .def("call", [](Interpreter &self, nb::args args) {
            Tokens tokens;
            for (auto arg : args) { tokens.push_back(nb::cast<std::string>(nb::str(arg))); }
            return self.call(tokens);
        })
        .def("split_list", &Interpreter::split_list, "list"_a)
        .def("create_command", [](Interpreter &self, const std::string &name, nb::callable function) {
            self.create_command(name, to_callback(std::move(function)));
        }, "name"_a, "function"_a)
        .def("delete_command", &Interpreter::delete_command, "name"_a);
}

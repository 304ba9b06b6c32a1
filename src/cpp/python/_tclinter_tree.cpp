#include <tclinter/python/python_callbacks.h>
#include <tclinter/tree/window.h>

void export_tree(nb::module_ &m) {
    using namespace tclinter;

    nb::class_<Container>(m, "Container")
        .def_prop_ro("path_name", &Container::path_name)
        .def_prop_ro("has_path_name", &Container::has_path_name)
        .def_prop_ro("is_destroyed", &Container::is_destroyed)
        .def_prop_ro("interpreter", &Container::interpreter, nb::rv_policy::reference_internal)
        .def_prop_ro("child_count", [](Container &self) { return self.children().size(); })
        .def("instance_count", [](Container &self, const std::string &class_name) {
            return self.instance_tracker().count(class_name);
        }, "class_name"_a);

    nb::class_<SessionOptions>(m, "SessionOptions")
        .def(nb::init<>())
        .def_rw("class_name", &SessionOptions::class_name)
        .def_rw("path_name", &SessionOptions::path_name)
        .def_rw("tracer", &SessionOptions::tracer);

    nb::class_<InterpreterSession, Container>(m, "InterpreterSession")
        .def_static("create", &InterpreterSession::create, "interpreter_options"_a = InterpreterOptions{},
                    "options"_a = SessionOptions{})
        .def_prop_ro("class_name", &InterpreterSession::class_name)
        .def("call", [](InterpreterSession &self, nb::args args) {
            Tokens tokens;
            for (auto arg : args) { tokens.push_back(nb::cast<std::string>(nb::str(arg))); }
            return self.call(tokens);
        })
        .def("bind", [](InterpreterSession &self, nb::kwargs kwargs) { self.commands().apply(to_options(kwargs)); })
        .def("resolve", [](InterpreterSession &self, const std::string &name) { return self.commands().resolve(name); },
             "name_or_alias"_a)
        .def("flag", [](InterpreterSession &self, const std::string &key) { return self.commands().flag(key); }, "key"_a)
        .def("destroy", &InterpreterSession::destroy);

    nb::class_<SessionPool>(m, "SessionPool")
        .def(nb::init<>())
        .def("get_or_create_default", &SessionPool::get_or_create_default, nb::rv_policy::reference_internal)
        .def("add", &SessionPool::add, "session"_a)
        .def("at", &SessionPool::at, "index"_a)
        .def("release", nb::overload_cast<std::size_t>(&SessionPool::release), "index"_a = 0)
        .def("drain", &SessionPool::drain)
        .def("__len__", &SessionPool::size);

    m.def("default_session_pool", &default_session_pool, nb::rv_policy::reference);

    nb::class_<Widget, Container>(m, "Widget")
        .def_static("create", [](Container &parent, std::string class_name, std::string kind, nb::kwargs kwargs) -> Widget & {
            return Widget::create(parent, std::move(class_name), std::move(kind), to_options(kwargs));
        }, "parent"_a, "class_name"_a, "kind"_a, "kwargs"_a, nb::rv_policy::reference, nb::keep_alive<0, 1>())
        .def_prop_ro("class_name", &Widget::class_name)
        .def_prop_ro("kind", &Widget::kind)
        .def_prop_ro("instance_index", &Widget::instance_index)
        .def("configure", [](Widget &self, nb::kwargs kwargs) { self.configure(to_options(kwargs)); })
        .def("cget", &Widget::cget, "key"_a)
        .def("resolve", [](Widget &self, const std::string &name) { return self.commands().resolve(name); },
             "name_or_alias"_a)
        .def("destroy", &Widget::destroy);

    nb::class_<Window, Widget>(m, "Window")
        .def_static("create", [](Container &parent, nb::kwargs kwargs) -> Window & {
            return Widget::create<Window>(parent, to_options(kwargs));
        }, "parent"_a, "kwargs"_a, nb::rv_policy::reference, nb::keep_alive<0, 1>());
}

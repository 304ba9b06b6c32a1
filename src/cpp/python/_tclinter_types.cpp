#include <tclinter/python/python_callbacks.h>
#include <tclinter/types/bounds.h>
#include <tclinter/types/ratio.h>

#include <nanobind/stl/map.h>

void export_types(nb::module_ &m) {
    using namespace tclinter;

    nb::enum_<ViolationPolicy>(m, "ViolationPolicy")
        .value("COMMIT", ViolationPolicy::commit)
        .value("ROLLBACK", ViolationPolicy::rollback);

    nb::class_<Variable>(m, "Variable")
        .def(nb::init<Value>(), "value"_a)
        .def_prop_rw("value", &Variable::value, &Variable::set_value)
        .def("add_observer", [](Variable &self, nb::object key, nb::callable observer) {
            self.observers().set(nb::cast<std::string>(nb::str(key)), to_observer(std::move(observer)));
        }, "key"_a, "observer"_a)
        .def("remove_observer", [](Variable &self, const std::string &key) { return self.observers().erase(key); },
             "key"_a)
        .def_prop_ro("observer_names", [](const Variable &self) { return self.observers().names(); })
        .def("notify", [](Variable &self, nb::args names) {
            if (names.size() == 0) { return self.observers()(); }
            std::vector<std::string> selected;
            for (auto name : names) { selected.push_back(nb::cast<std::string>(nb::str(name))); }
            return self.observers()(selected);
        })
        .def("notify_with", [](Variable &self, nb::kwargs arguments) {
            std::vector<std::pair<std::string, std::vector<Value>>> selected;
            for (auto [name, args] : arguments) {
                std::vector<Value> values;
                if (nb::isinstance<nb::tuple>(args) || nb::isinstance<nb::list>(args)) {
                    for (auto arg : args) { values.push_back(nb::cast<Value>(arg)); }
                } else {
                    values.push_back(nb::cast<Value>(args));
                }
                selected.emplace_back(nb::cast<std::string>(name), std::move(values));
            }
            return self.observers().notify_with(selected);
        });

    using ValueBounds = Bounds<Value>;
    nb::class_<ValueBounds>(m, "Bounds")
        .def(nb::init<Variable &, std::optional<Value>, std::optional<Value>, ViolationPolicy>(), "enforces"_a,
             "minimum"_a = nb::none(), "maximum"_a = nb::none(), "policy"_a = ViolationPolicy::commit,
             nb::keep_alive<1, 2>())
        .def_prop_rw("minimum", &ValueBounds::minimum, &ValueBounds::set_minimum)
        .def_prop_rw("maximum", &ValueBounds::maximum, &ValueBounds::set_maximum)
        .def_prop_ro("policy", &ValueBounds::policy)
        .def_prop_ro("satisfied", &ValueBounds::satisfied)
        .def("enforce", &ValueBounds::enforce);

    using IntRatio = Ratio<int64_t>;
    nb::class_<IntRatio>(m, "Ratio")
        .def(nb::init<int64_t, int64_t>(), "numerator"_a = 1, "denominator"_a = 1)
        .def_prop_rw("numerator", &IntRatio::numerator, &IntRatio::set_numerator)
        .def_prop_rw("denominator", &IntRatio::denominator, &IntRatio::set_denominator)
        .def_prop_ro("reduced", &IntRatio::reduced)
        .def("reduce", &IntRatio::reduce)
        .def_prop_ro("ratio", &IntRatio::ratio);
}

#include <tclinter/python/python_callbacks.h>

namespace tclinter {
    namespace {
        bool all_callable(const nb::handle &sequence) {
            std::size_t count{0};
            for (auto item : sequence) {
                if (!PyCallable_Check(item.ptr())) { return false; }
                ++count;
            }
            return count > 0;
        }

        std::string declared_name(const nb::handle &function) {
            if (nb::hasattr(function, "__name__")) { return nb::cast<std::string>(nb::str(function.attr("__name__"))); }
            return {};
        }
    } // namespace

    nb::tuple to_tuple(const Tokens &tokens) {
        nb::list items;
        for (const auto &token : tokens) { items.append(nb::str(token.c_str())); }
        return nb::tuple(items);
    }

    Callback to_callback(nb::callable function) {
        return [function = std::move(function)](const Tokens &arguments) -> Tokens {
            nb::gil_scoped_acquire guard;
            nb::object result = function(*to_tuple(arguments));
            if (result.is_none()) { return {}; }
            if (nb::isinstance<nb::tuple>(result) || nb::isinstance<nb::list>(result)) {
                Tokens words;
                for (auto item : result) { words.push_back(nb::cast<std::string>(nb::str(item))); }
                return words;
            }
            return {nb::cast<std::string>(nb::str(result))};
        };
    }

    Options to_options(const nb::kwargs &kwargs) {
        Options options;
        for (auto [key, value] : kwargs) {
            auto name = nb::cast<std::string>(key);
            bool sequence = nb::isinstance<nb::tuple>(value) || nb::isinstance<nb::list>(value);

            if (PyCallable_Check(value.ptr())) {
                options.emplace_back(name, CallbackGroup{to_callback(nb::borrow<nb::callable>(value)), declared_name(value)});
            } else if (sequence && all_callable(value)) {
                std::vector<Callback> functions;
                for (auto item : value) { functions.push_back(to_callback(nb::borrow<nb::callable>(item))); }
                options.emplace_back(name, CallbackGroup{std::move(functions), name});
            } else if (sequence) {
                Tokens tokens;
                for (auto item : value) { tokens.push_back(nb::cast<std::string>(nb::str(item))); }
                if (tokens.empty()) { throw_error<UnsupportedTypeError>("Option '{}' is an empty sequence", name); }
                options.emplace_back(name, FlagValue{std::move(tokens)});
            } else {
                options.emplace_back(name, FlagValue{nb::cast<std::string>(nb::str(value))});
            }
        }
        return options;
    }

    Observers<Value>::observer_type to_observer(nb::callable observer) {
        return [observer = std::move(observer)](std::span<const Value> arguments) -> std::optional<Value> {
            nb::gil_scoped_acquire guard;
            nb::list items;
            for (const auto &argument : arguments) { items.append(nb::cast(argument)); }
            nb::object result = observer(*nb::tuple(items));
            if (result.is_none()) { return std::nullopt; }
            return nb::cast<Value>(result);
        };
    }
} // namespace tclinter

#ifndef TCLINTER_OBSERVERS_H
#define TCLINTER_OBSERVERS_H

#include <tclinter/types/value.h>

#include <algorithm>
#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <type_traits>
#include <vector>

namespace tclinter {
    /**
     * A named set of observers of a value of type T.
     *
     * An observer is called either with no arguments (a broadcast: "something changed, re-check") or with an
     * explicit argument list through notify_with. Each observer may report a result; observers that only
     * re-check report std::nullopt.
     *
     * Observers run in the order they were added. Adding an observer under an existing name replaces it in
     * place. The set may be changed from inside an observer; a notification in progress carries on with the
     * observers it started with.
     */
    template<typename T>
    class Observers {
    public:
        using value_type = T;
        using result_type = std::optional<T>;
        using observer_type = std::function<result_type(std::span<const T>)>;
        using results_type = std::map<std::string, result_type>;

        /**
         * Add or replace an observer. Accepts callables taking ``std::span<const T>`` or nothing, returning
         * ``std::optional<T>``, something convertible to it, or void.
         * @throws ValueError when the callable is empty
         */
        template<typename F>
        void set(std::string name, F &&observer) {
            using Fn = std::decay_t<F>;
            if constexpr (std::is_pointer_v<Fn> || requires(const Fn &f) { f.target_type(); }) {
                if (!observer) { throw_error<ValueError>("Observer '{}' is not callable", name); }
            }
            set_observer(std::move(name), make_observer(std::forward<F>(observer)));
        }

        /**
         * Keys that are not strings are coerced with fmt, so ``set(42, ...)`` registers ``"42"``.
         */
        template<typename K, typename F>
            requires (!std::convertible_to<K, std::string>)
        void set(const K &key, F &&observer) {
            set(fmt::format("{}", key), std::forward<F>(observer));
        }

        bool erase(const std::string &name) {
            return std::erase_if(_observers, [&](const auto &o) { return o.first == name; }) > 0;
        }

        [[nodiscard]] bool contains(const std::string &name) const { return find(name) != _observers.end(); }

        [[nodiscard]] std::size_t size() const noexcept { return _observers.size(); }

        [[nodiscard]] bool empty() const noexcept { return _observers.empty(); }

        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> result;
            result.reserve(_observers.size());
            for (const auto &[name, _] : _observers) { result.push_back(name); }
            return result;
        }

        /**
         * Broadcast: invoke every observer with no arguments.
         */
        results_type operator()() const {
            results_type results;
            auto snapshot = _observers;
            for (const auto &[name, observer] : snapshot) { results[name] = observer({}); }
            return results;
        }

        /**
         * Invoke only the named observers, with no arguments.
         * @throws LookupError on an unknown name, before any observer has run
         */
        results_type operator()(const std::vector<std::string> &names) const {
            std::vector<observer_type> selected;
            selected.reserve(names.size());
            for (const auto &name : names) { selected.push_back(at(name)); }

            results_type results;
            for (std::size_t i = 0; i < names.size(); ++i) { results[names[i]] = selected[i]({}); }
            return results;
        }

        /**
         * Invoke each named observer with its own argument list.
         * @throws LookupError on an unknown name, before any observer has run
         */
        results_type notify_with(const std::vector<std::pair<std::string, std::vector<T>>> &arguments) const {
            std::vector<observer_type> selected;
            selected.reserve(arguments.size());
            for (const auto &[name, _] : arguments) { selected.push_back(at(name)); }

            results_type results;
            for (std::size_t i = 0; i < arguments.size(); ++i) {
                const auto &[name, args] = arguments[i];
                results[name] = selected[i](std::span<const T>{args});
            }
            return results;
        }

        /**
         * Invoke one observer with a single value.
         */
        result_type notify_with(const std::string &name, const T &value) const {
            return at(name)(std::span<const T>{&value, 1});
        }

        /**
         * @throws LookupError on an unknown name
         */
        [[nodiscard]] const observer_type &at(const std::string &name) const {
            auto it = find(name);
            if (it == _observers.end()) { throw_error<LookupError>("No observer registered as '{}'", name); }
            return it->second;
        }

    private:
        using entry_type = std::pair<std::string, observer_type>;

        template<typename F>
        static observer_type make_observer(F &&observer) {
            using Fn = std::decay_t<F>;
            if constexpr (std::same_as<Fn, observer_type>) {
                return std::forward<F>(observer);
            } else if constexpr (std::is_invocable_v<Fn &, std::span<const T>>) {
                using R = std::invoke_result_t<Fn &, std::span<const T>>;
                if constexpr (std::is_void_v<R>) {
                    return [f = std::forward<F>(observer)](std::span<const T> args) mutable -> result_type {
                        f(args);
                        return std::nullopt;
                    };
                } else {
                    return observer_type(std::forward<F>(observer));
                }
            } else {
                static_assert(std::is_invocable_v<Fn &>, "An observer takes no arguments or a std::span<const T>");
                using R = std::invoke_result_t<Fn &>;
                return [f = std::forward<F>(observer)](std::span<const T>) mutable -> result_type {
                    if constexpr (std::is_void_v<R>) {
                        f();
                        return std::nullopt;
                    } else {
                        return f();
                    }
                };
            }
        }

        void set_observer(std::string name, observer_type observer) {
            if (!observer) { throw_error<ValueError>("Observer '{}' is not callable", name); }
            auto it = std::find_if(_observers.begin(), _observers.end(), [&](const auto &o) { return o.first == name; });
            if (it != _observers.end()) {
                it->second = std::move(observer);
            } else {
                _observers.emplace_back(std::move(name), std::move(observer));
            }
        }

        [[nodiscard]] typename std::vector<entry_type>::const_iterator find(const std::string &name) const {
            return std::find_if(_observers.begin(), _observers.end(), [&](const auto &o) { return o.first == name; });
        }

        std::vector<entry_type> _observers{};
    };
} // namespace tclinter

#endif // TCLINTER_OBSERVERS_H

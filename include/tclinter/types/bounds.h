#ifndef TCLINTER_BOUNDS_H
#define TCLINTER_BOUNDS_H

#include <tclinter/types/reactive_variable.h>

namespace tclinter {
    /**
     * What a Bounds constraint leaves behind when a write takes the variable out of its interval.
     */
    enum class ViolationPolicy {
        // The write stands, the constraint reports the violation after the fact
        commit,
        // The constraint restores the last value it saw inside the interval, then reports the violation
        rollback,
    };

    /**
     * Enforces a closed interval ``[minimum, maximum]`` on a ReactiveVariable.
     *
     * The constraint registers itself as an observer of the variable (keyed by its own address) and re-checks
     * the interval on every write. A value outside the interval throws BoundsViolation from the write; there is
     * no recovery path, a violation is a programming error. Under ViolationPolicy::commit the variable keeps
     * the offending value.
     *
     * A bound that has not been set is not enforced. The variable must outlive the constraint.
     */
    template<typename T>
    class Bounds {
    public:
        /**
         * @throws TypeError when a bound's type differs from the variable's current value
         * @throws ValueError when minimum > maximum
         */
        explicit Bounds(ReactiveVariable<T> &enforces, std::optional<T> minimum = std::nullopt,
                        std::optional<T> maximum = std::nullopt, ViolationPolicy policy = ViolationPolicy::commit)
            : _enforces{&enforces}, _policy{policy}, _observer_key{fmt::format("{}", fmt::ptr(this))} {
            if (minimum.has_value()) { set_minimum(std::move(*minimum)); }
            if (maximum.has_value()) { set_maximum(std::move(*maximum)); }
            if (satisfied()) { _last_satisfied = _enforces->value(); }
            _enforces->observers().set(_observer_key, [this]() { enforce(); });
        }

        ~Bounds() { _enforces->observers().erase(_observer_key); }

        Bounds(const Bounds &) = delete;
        Bounds &operator=(const Bounds &) = delete;

        [[nodiscard]] const std::optional<T> &minimum() const noexcept { return _minimum; }

        [[nodiscard]] const std::optional<T> &maximum() const noexcept { return _maximum; }

        [[nodiscard]] ReactiveVariable<T> &enforces() const noexcept { return *_enforces; }

        [[nodiscard]] ViolationPolicy policy() const noexcept { return _policy; }

        [[nodiscard]] const std::string &observer_key() const noexcept { return _observer_key; }

        void set_minimum(T value) {
            check_type("minimum", value);
            if (_maximum.has_value() && *_maximum < value) {
                throw_error<ValueError>("minimum {} is greater than maximum {}", to_string(value), to_string(*_maximum));
            }
            _minimum = std::move(value);
        }

        void set_maximum(T value) {
            check_type("maximum", value);
            if (_minimum.has_value() && value < *_minimum) {
                throw_error<ValueError>("maximum {} is less than minimum {}", to_string(value), to_string(*_minimum));
            }
            _maximum = std::move(value);
        }

        /**
         * Whether the current value lies inside the interval. A value that does not compare with a bound (NaN) does
     * not.
         * @throws TypeError when the value no longer has the type of the bounds
         */
        [[nodiscard]] bool satisfied() const {
            const auto &value = _enforces->value();
            if (_minimum.has_value()) {
                require_same_type("minimum", *_minimum, value);
                if (!(*_minimum <= value)) { return false; }
            }
            if (_maximum.has_value()) {
                require_same_type("maximum", *_maximum, value);
                if (!(value <= *_maximum)) { return false; }
            }
            return true;
        }

        /**
         * Re-check the interval, called on every write of the variable.
         * @throws BoundsViolation when the current value is outside the interval
         */
        void enforce() {
            if (satisfied()) {
                _last_satisfied = _enforces->value();
                return;
            }

            auto offending = to_string(_enforces->value());
            if (_policy == ViolationPolicy::rollback && _last_satisfied.has_value()) {
                _enforces->set_value(*_last_satisfied);
            }
            throw_error<BoundsViolation>("{} is outside of [{}, {}]", offending, describe(_minimum), describe(_maximum));
        }

    private:
        void check_type(std::string_view what, const T &value) const {
            require_same_type(what, value, _enforces->value());
        }

        static void require_same_type(std::string_view what, const T &bound, const T &value) {
            if (!same_type(bound, value)) {
                throw_error<TypeError>("{} of type {} does not match the constrained value of type {}", what,
                                       type_name(bound), type_name(value));
            }
        }

        static std::string describe(const std::optional<T> &bound) {
            return bound.has_value() ? to_string(*bound) : std::string{"-"};
        }

        ReactiveVariable<T> *_enforces;
        ViolationPolicy _policy;
        std::string _observer_key;
        std::optional<T> _minimum{};
        std::optional<T> _maximum{};
        std::optional<T> _last_satisfied{};
    };
} // namespace tclinter

#endif // TCLINTER_BOUNDS_H

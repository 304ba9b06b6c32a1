#ifndef TCLINTER_REACTIVE_VARIABLE_H
#define TCLINTER_REACTIVE_VARIABLE_H

#include <tclinter/types/observers.h>

namespace tclinter {
    /**
     * A single mutable value that re-broadcasts to its observers on every write.
     *
     * There is no way to write without notifying: a derived constraint has to see every transition of the value,
     * including writes of the value it already holds. Observers are called with no arguments and read the
     * current value back from the variable.
     */
    template<typename T>
    class ReactiveVariable {
    public:
        using value_type = T;

        explicit ReactiveVariable(T value) : _value(std::move(value)) { _observers(); }

        /**
         * Initialise from a factory instead of a value.
         * @throws ValueError when the factory is empty
         */
        static ReactiveVariable from_default(const std::function<T()> &factory) {
            if (!factory) { throw_error<ValueError>("A default factory must be callable"); }
            return ReactiveVariable(factory());
        }

        // Observers refer back to the variable, so it stays where it was built
        ReactiveVariable(const ReactiveVariable &) = delete;
        ReactiveVariable &operator=(const ReactiveVariable &) = delete;

        [[nodiscard]] const T &value() const noexcept { return _value; }

        /**
         * Store the value, then notify every observer. An exception thrown by an observer propagates after the
         * value has been stored.
         */
        void set_value(T value) {
            _value = std::move(value);
            _observers();
        }

        [[nodiscard]] Observers<T> &observers() noexcept { return _observers; }

        [[nodiscard]] const Observers<T> &observers() const noexcept { return _observers; }

    private:
        T _value;
        Observers<T> _observers{};
    };

    using Variable = ReactiveVariable<Value>;
} // namespace tclinter

#endif // TCLINTER_REACTIVE_VARIABLE_H

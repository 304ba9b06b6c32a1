#ifndef TCLINTER_RATIO_H
#define TCLINTER_RATIO_H

#include <tclinter/util/errors.h>

#include <concepts>
#include <cstdint>
#include <numeric>
#include <utility>

namespace tclinter {
    /**
     * A numerator/denominator pair that is reduced lazily.
     *
     * Writing a different numerator or denominator clears the reduced flag; ratio() reduces before returning.
     */
    template<std::integral T = int64_t>
    class Ratio {
    public:
        explicit Ratio(T numerator = 1, T denominator = 1) : _numerator{numerator}, _denominator{denominator} {}

        [[nodiscard]] T numerator() const noexcept { return _numerator; }

        [[nodiscard]] T denominator() const noexcept { return _denominator; }

        [[nodiscard]] bool reduced() const noexcept { return _reduced; }

        void set_numerator(T value) noexcept {
            if (value != _numerator) { _reduced = false; }
            _numerator = value;
        }

        void set_denominator(T value) noexcept {
            if (value != _denominator) { _reduced = false; }
            _denominator = value;
        }

        /**
         * Divide both components by their greatest common divisor.
         * @throws ValueError for 0/0, which has no divisor
         */
        void reduce() {
            T divisor = std::gcd(_numerator, _denominator);
            if (divisor == 0) { throw_error<ValueError>("Cannot reduce the ratio 0/0"); }
            set_numerator(_numerator / divisor);
            set_denominator(_denominator / divisor);
            _reduced = true;
        }

        [[nodiscard]] std::pair<T, T> ratio() {
            if (!_reduced) { reduce(); }
            return {_numerator, _denominator};
        }

    private:
        T _numerator;
        T _denominator;
        bool _reduced{false};
    };
} // namespace tclinter

#endif // TCLINTER_RATIO_H

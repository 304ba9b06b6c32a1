#ifndef TCLINTER_UTIL_WRITE_ONCE_H
#define TCLINTER_UTIL_WRITE_ONCE_H

#include <tclinter/util/errors.h>

#include <optional>
#include <string>
#include <utility>

namespace tclinter {
    /**
     * A slot that accepts exactly one assignment.
     *
     * Objects that mirror a native, single initialisation resource (an interpreter handle, a tree-path name, a
     * parent link) hold the value in a WriteOnce. The owner assigns it during construction; any later assignment
     * throws InstantiatedError and leaves the stored value untouched.
     */
    template<typename T>
    class WriteOnce {
    public:
        explicit WriteOnce(std::string slot_name) : _slot_name{std::move(slot_name)} {}

        WriteOnce(const WriteOnce &) = delete;
        WriteOnce &operator=(const WriteOnce &) = delete;

        template<typename U>
        void set(U &&value) {
            if (_value.has_value()) { throw InstantiatedError{_slot_name}; }
            _value.emplace(std::forward<U>(value));
        }

        [[nodiscard]] bool has_value() const noexcept { return _value.has_value(); }

        [[nodiscard]] const T &get() const {
            if (!_value.has_value()) { throw_error<LookupError>("{} has not been instantiated", _slot_name); }
            return *_value;
        }

        [[nodiscard]] T &get() {
            if (!_value.has_value()) { throw_error<LookupError>("{} has not been instantiated", _slot_name); }
            return *_value;
        }

        [[nodiscard]] const std::string &slot_name() const noexcept { return _slot_name; }

    private:
        std::string _slot_name;
        std::optional<T> _value;
    };
} // namespace tclinter

#endif // TCLINTER_UTIL_WRITE_ONCE_H

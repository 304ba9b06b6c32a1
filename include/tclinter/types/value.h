#ifndef TCLINTER_VALUE_H
#define TCLINTER_VALUE_H

#include <tclinter/tclinter_base.h>

#include <cstdint>
#include <string_view>
#include <typeinfo>
#include <variant>

namespace tclinter {
    /**
     * The dynamically typed payload of a reactive variable whose type is only known at runtime (the Python
     * bindings use this). Comparisons between two values are only meaningful when both hold the same
     * alternative, see same_type.
     */
    using Value = std::variant<bool, int64_t, double, std::string>;

    /**
     * Whether two values carry the same type. For statically typed T this is always true.
     */
    template<typename T>
    [[nodiscard]] constexpr bool same_type(const T &, const T &) noexcept { return true; }

    [[nodiscard]] inline bool same_type(const Value &lhs, const Value &rhs) noexcept { return lhs.index() == rhs.index(); }

    /**
     * Name of the type held, used in error messages.
     */
    template<typename T>
    [[nodiscard]] std::string_view type_name(const T &) { return typeid(T).name(); }

    [[nodiscard]] TCLINTER_EXPORT std::string_view type_name(const Value &value);

    /**
     * Render a value for messages and interpreter arguments.
     */
    template<typename T>
    [[nodiscard]] std::string to_string(const T &value) { return fmt::format("{}", value); }

    [[nodiscard]] TCLINTER_EXPORT std::string to_string(const Value &value);
} // namespace tclinter

#endif // TCLINTER_VALUE_H

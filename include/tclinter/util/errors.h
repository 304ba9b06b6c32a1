#ifndef TCLINTER_UTIL_ERRORS
#define TCLINTER_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tclinter {

    /**
     * A write-once slot (interpreter handle, tree-path name, children, command registry, parent) was assigned a
     * second time. This is always a construction ordering bug in the calling code.
     */
    struct InstantiatedError : std::logic_error {
        explicit InstantiatedError(std::string_view slot_name)
            : std::logic_error{fmt::format("{} is already instantiated", slot_name)}, slot{slot_name} {}

        std::string slot;
    };

    /**
     * The parent supplied to a node cannot own children or does not expose an interpreter.
     */
    struct StructuralError : std::logic_error {
        using std::logic_error::logic_error;
    };

    /**
     * An unknown command name, alias or observer name was used.
     */
    struct LookupError : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    /**
     * A bound has a different type from the value it constrains.
     */
    struct TypeError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * A value is well typed but not acceptable, e.g. a bound that would invert its interval.
     */
    struct ValueError : std::domain_error {
        using std::domain_error::domain_error;
    };

    /**
     * An observed value left the interval of a Bounds constraint.
     */
    struct BoundsViolation : std::range_error {
        using std::range_error::range_error;
    };

    /**
     * A configuration or registration value whose shape cannot be classified as a callback or a flag.
     */
    struct UnsupportedTypeError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * The native interpreter rejected an instruction.
     */
    struct InterpreterError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace tclinter

#endif // TCLINTER_UTIL_ERRORS

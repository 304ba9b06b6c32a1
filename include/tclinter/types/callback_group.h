#ifndef TCLINTER_CALLBACK_GROUP_H
#define TCLINTER_CALLBACK_GROUP_H

#include <tclinter/interpreter/interpreter.h>

#include <concepts>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <variant>

namespace tclinter {
    using Callback = CommandFunction;

    /**
     * One or more callables registered behind a single interpreter command.
     *
     * Invocation is a reverse chain: the callable added last runs first with the invocation arguments, and
     * whatever it returns becomes the argument list of the one before it. The result of the first callable is
     * the result of the group. An empty result simply means the next callable is invoked with no arguments.
     */
    struct TCLINTER_EXPORT CallbackGroup {
        CallbackGroup(std::initializer_list<Callback> functions);

        explicit CallbackGroup(std::vector<Callback> functions, std::string name = {});

        template<typename F>
            requires (!std::same_as<std::remove_cvref_t<F>, CallbackGroup> &&
                      std::is_invocable_r_v<Tokens, F &, const Tokens &>)
        CallbackGroup(F &&function, std::string name = {})
            : CallbackGroup(std::vector<Callback>{Callback(std::forward<F>(function))}, std::move(name)) {}

        Tokens operator()(const Tokens &arguments) const;

        /**
         * The declared name, appended to the generated command name when present.
         */
        [[nodiscard]] const std::string &name() const noexcept { return _name; }

        [[nodiscard]] std::size_t size() const noexcept { return _functions.size(); }

        [[nodiscard]] const std::vector<Callback> &functions() const noexcept { return _functions; }

        /**
         * @throws UnsupportedTypeError when the group holds no callables or an empty std::function
         */
        void validate() const;

    private:
        std::vector<Callback> _functions;
        std::string _name;
    };

    /**
     * A configuration value that is rendered as literal interpreter arguments after its ``-key`` marker.
     */
    struct TCLINTER_EXPORT FlagValue {
        FlagValue() = default;

        FlagValue(std::string token) : tokens{std::move(token)} {}

        FlagValue(const char *token) : tokens{std::string{token}} {}

        FlagValue(Tokens tokens_) : tokens{std::move(tokens_)} {}

        template<typename T>
            requires std::is_arithmetic_v<T>
        FlagValue(T value) : tokens{fmt::format("{}", value)} {}

        Tokens tokens;
    };

    /**
     * A configuration entry, classified by the caller as either a callback group or a flag value.
     */
    using ConfigValue = std::variant<CallbackGroup, FlagValue>;

    using Option = std::pair<std::string, ConfigValue>;

    /**
     * Configuration keyword arguments in the order they were given.
     */
    using Options = std::vector<Option>;

    [[nodiscard]] inline bool is_callback(const ConfigValue &value) noexcept {
        return std::holds_alternative<CallbackGroup>(value);
    }
} // namespace tclinter

#endif // TCLINTER_CALLBACK_GROUP_H

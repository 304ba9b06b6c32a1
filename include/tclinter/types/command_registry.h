#ifndef TCLINTER_COMMAND_REGISTRY_H
#define TCLINTER_COMMAND_REGISTRY_H

#include <tclinter/types/callback_group.h>

#include <optional>

namespace tclinter {
    /**
     * The vocabulary an object uses to talk to the interpreter: the callback commands it has registered and the
     * flag tuples its configuration renders into.
     *
     * * ``commands`` maps a generated command name to the callback group behind it. Every entry exists as a
     *   command inside the interpreter until release_all() (or the destructor) deletes it.
     * * ``aliases`` maps a configuration key to a generated command name.
     * * ``flags`` maps a configuration key to ``("-" + key, tokens...)``.
     *
     * All three mappings are owned by the registry and built in its constructor; they are never replaced.
     */
    struct TCLINTER_EXPORT CommandRegistry {
        using command_entry = std::pair<std::string, std::shared_ptr<const CallbackGroup>>;

        explicit CommandRegistry(Interpreter &interpreter);

        /**
         * Classify each option: callback groups are registered and aliased under their key, flag values are
         * registered as flags under their key.
         */
        CommandRegistry(Interpreter &interpreter, const Options &options);

        /**
         * Deletes any command still registered. Failures are reported on stderr, never thrown.
         */
        ~CommandRegistry();

        CommandRegistry(const CommandRegistry &) = delete;
        CommandRegistry &operator=(const CommandRegistry &) = delete;

        /**
         * Register the options on top of what is already registered. A callback option whose key already has an
         * alias replaces the command behind that alias.
         */
        void apply(const Options &options);

        /**
         * Create an interpreter command for ``group`` and return its generated name. The name is built from the
         * address of the stored group followed by the group's declared name.
         * @throws UnsupportedTypeError when the group is empty
         */
        std::string register_callback(CallbackGroup group);

        /**
         * @throws LookupError when ``generated_name`` was never registered
         */
        void alias(const std::string &short_name, const std::string &generated_name);

        /**
         * Stores ``("-" + key, tokens...)`` under key and returns the key.
         */
        std::string register_flag(const std::string &key, Tokens tokens = {});

        /**
         * Delete one command from the interpreter and forget it, together with any alias pointing at it.
         * @throws LookupError when the name (or alias) is unknown
         */
        void unregister(const std::string &name_or_alias);

        /**
         * Delete every registered command from the interpreter, one delete per command. Aliases are dropped.
         */
        void release_all();

        /**
         * Run a registered group directly, as the interpreter would.
         * @throws LookupError when the name (or alias) is unknown
         */
        Tokens invoke(const std::string &name_or_alias, const Tokens &arguments = {}) const;

        /**
         * The generated command name behind a name or alias.
         * @throws LookupError when neither is known
         */
        [[nodiscard]] const std::string &resolve(const std::string &name_or_alias) const;

        [[nodiscard]] bool contains(const std::string &name_or_alias) const;

        /**
         * @throws LookupError when no flag was registered under key
         */
        [[nodiscard]] const Tokens &flag(const std::string &key) const;

        /**
         * The flattened flag tokens of every flag option, in option order. Callback options contribute nothing.
         */
        [[nodiscard]] Tokens flag_tokens(const Options &options) const;

        [[nodiscard]] const std::vector<command_entry> &commands() const noexcept { return _commands; }

        [[nodiscard]] const std::vector<std::pair<std::string, std::string>> &aliases() const noexcept { return _aliases; }

        [[nodiscard]] const std::vector<std::pair<std::string, Tokens>> &flags() const noexcept { return _flags; }

        [[nodiscard]] Interpreter &interpreter() const noexcept { return *_interpreter; }

    private:
        [[nodiscard]] const std::string *find_alias(const std::string &alias) const;

        [[nodiscard]] std::vector<command_entry>::const_iterator find_command(const std::string &name) const;

        Interpreter *_interpreter;
        std::vector<command_entry> _commands{};
        std::vector<std::pair<std::string, std::string>> _aliases{};
        std::vector<std::pair<std::string, Tokens>> _flags{};
    };
} // namespace tclinter

#endif // TCLINTER_COMMAND_REGISTRY_H

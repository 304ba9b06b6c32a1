#include <tclinter/types/command_registry.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iterator>

namespace tclinter {
    CommandRegistry::CommandRegistry(Interpreter &interpreter) : _interpreter{&interpreter} {}

    CommandRegistry::CommandRegistry(Interpreter &interpreter, const Options &options) : _interpreter{&interpreter} {
        apply(options);
    }

    CommandRegistry::~CommandRegistry() {
        try {
            release_all();
        } catch (const std::exception &e) {
            // Destructors must not throw, the interpreter has most likely been torn down already.
            fmt::print(stderr, "Warning: exception while releasing commands: {}\n", e.what());
        }
    }

    void CommandRegistry::apply(const Options &options) {
        for (const auto &[key, value] : options) {
            if (const auto *group = std::get_if<CallbackGroup>(&value)) {
                auto previous = find_alias(key);
                std::optional<std::string> replaced;
                if (previous != nullptr) { replaced = *previous; }

                auto name = register_callback(*group);
                if (replaced.has_value()) { unregister(*replaced); }
                alias(key, name);
            } else {
                register_flag(key, std::get<FlagValue>(value).tokens);
            }
        }
    }

    std::string CommandRegistry::register_callback(CallbackGroup group) {
        group.validate();
        auto stored = std::make_shared<const CallbackGroup>(std::move(group));
        auto name = fmt::format("{}{}", reinterpret_cast<std::uintptr_t>(stored.get()), stored->name());

        _interpreter->create_command(name, [stored](const Tokens &arguments) {
            // A callback may unregister the group it runs in, the group lives until the call returns
            auto group = stored;
            return (*group)(arguments);
        });
        _commands.emplace_back(name, std::move(stored));
        return name;
    }

    void CommandRegistry::alias(const std::string &short_name, const std::string &generated_name) {
        if (find_command(generated_name) == _commands.end()) {
            throw_error<LookupError>("Cannot alias '{}' to unregistered command '{}'", short_name, generated_name);
        }
        auto it = std::find_if(_aliases.begin(), _aliases.end(), [&](const auto &a) { return a.first == short_name; });
        if (it != _aliases.end()) {
            it->second = generated_name;
        } else {
            _aliases.emplace_back(short_name, generated_name);
        }
    }

    std::string CommandRegistry::register_flag(const std::string &key, Tokens tokens) {
        Tokens flag;
        flag.reserve(tokens.size() + 1);
        flag.push_back("-" + key);
        std::move(tokens.begin(), tokens.end(), std::back_inserter(flag));

        auto it = std::find_if(_flags.begin(), _flags.end(), [&](const auto &f) { return f.first == key; });
        if (it != _flags.end()) {
            it->second = std::move(flag);
        } else {
            _flags.emplace_back(key, std::move(flag));
        }
        return key;
    }

    void CommandRegistry::unregister(const std::string &name_or_alias) {
        auto name = resolve(name_or_alias);
        _commands.erase(find_command(name));
        std::erase_if(_aliases, [&](const auto &a) { return a.second == name; });
        _interpreter->delete_command(name);
    }

    void CommandRegistry::release_all() {
        _aliases.clear();
        while (!_commands.empty()) {
            auto name = _commands.front().first;
            _commands.erase(_commands.begin());
            _interpreter->delete_command(name);
        }
    }

    Tokens CommandRegistry::invoke(const std::string &name_or_alias, const Tokens &arguments) const {
        auto it = find_command(resolve(name_or_alias));
        return (*it->second)(arguments);
    }

    const std::string &CommandRegistry::resolve(const std::string &name_or_alias) const {
        auto it = find_command(name_or_alias);
        if (it != _commands.end()) { return it->first; }
        if (const auto *alias = find_alias(name_or_alias); alias != nullptr) { return *alias; }
        throw_error<LookupError>("No command registered as '{}'", name_or_alias);
    }

    bool CommandRegistry::contains(const std::string &name_or_alias) const {
        return find_command(name_or_alias) != _commands.end() || find_alias(name_or_alias) != nullptr;
    }

    const Tokens &CommandRegistry::flag(const std::string &key) const {
        auto it = std::find_if(_flags.begin(), _flags.end(), [&](const auto &f) { return f.first == key; });
        if (it == _flags.end()) { throw_error<LookupError>("No flag registered as '{}'", key); }
        return it->second;
    }

    Tokens CommandRegistry::flag_tokens(const Options &options) const {
        Tokens tokens;
        for (const auto &[key, value] : options) {
            if (is_callback(value)) { continue; }
            const auto &f = flag(key);
            tokens.insert(tokens.end(), f.begin(), f.end());
        }
        return tokens;
    }

    const std::string *CommandRegistry::find_alias(const std::string &alias) const {
        auto it = std::find_if(_aliases.begin(), _aliases.end(), [&](const auto &a) { return a.first == alias; });
        return it == _aliases.end() ? nullptr : &it->second;
    }

    std::vector<CommandRegistry::command_entry>::const_iterator CommandRegistry::find_command(const std::string &name) const {
        return std::find_if(_commands.begin(), _commands.end(), [&](const auto &c) { return c.first == name; });
    }
} // namespace tclinter

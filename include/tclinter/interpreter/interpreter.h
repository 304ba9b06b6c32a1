#ifndef TCLINTER_INTERPRETER_H
#define TCLINTER_INTERPRETER_H

#include <tclinter/tclinter_base.h>

#include <optional>
#include <string_view>

namespace tclinter {
    /**
     * The callable behind an interpreter command. Receives the words the interpreter passed after the command
     * name and returns the words to hand back as the command result.
     */
    using CommandFunction = std::function<Tokens(const Tokens &)>;

    /**
     * Arguments of the native ``create`` call. Field names follow the native entry point. ``want_objects`` is
     * carried for parity only, results always come back as strings.
     */
    struct InterpreterOptions {
        std::optional<std::string> screen_name{};
        std::string base_name{};
        std::string class_name{"Root"};
        bool interactive{false};
        bool want_objects{true};
        bool init_tk{true};
        bool sync{false};
        std::optional<std::string> use{};
    };

    /**
     * Receives every instruction the interpreter executes. Attach with Interpreter::set_trace.
     */
    struct TCLINTER_EXPORT CommandTracer {
        virtual ~CommandTracer() = default;

        virtual void on_before_call(const Tokens &tokens) = 0;

        virtual void on_after_call(const Tokens &tokens, const std::string &result) = 0;

        virtual void on_call_failed(const Tokens &tokens, const std::string &error) = 0;
    };

    /**
     * One live native interpreter. The interpreter has no concept of objects, only string commands and
     * string-named variables; everything in the object tree talks to it through this interface.
     */
    struct TCLINTER_EXPORT Interpreter {
        virtual ~Interpreter() = default;

        /**
         * Execute one instruction, the first token is the command name.
         * @throws InterpreterError when the interpreter rejects the instruction
         */
        virtual std::string call(const Tokens &tokens) = 0;

        /**
         * Parse an interpreter list literal into its elements.
         * @throws InterpreterError when the literal is not a well-formed list
         */
        [[nodiscard]] virtual Tokens split_list(std::string_view list) const = 0;

        /**
         * Make ``function`` reachable from interpreter scripts as the command ``name``.
         */
        virtual void create_command(const std::string &name, CommandFunction function) = 0;

        /**
         * @throws InterpreterError when no command of that name exists
         */
        virtual void delete_command(const std::string &name) = 0;

        /**
         * Attach (or with nullptr detach) an observer of every call.
         */
        virtual void set_trace(command_tracer_s_ptr tracer) = 0;
    };
} // namespace tclinter

#endif // TCLINTER_INTERPRETER_H

#ifndef TCLINTER_TCL_INTERPRETER_H
#define TCLINTER_TCL_INTERPRETER_H

#include <tclinter/interpreter/interpreter.h>

#include <unordered_map>

struct Tcl_Interp;

namespace tclinter {
    /**
     * Interpreter backed by the Tcl (and optionally Tk) C library.
     *
     * Commands created through create_command are Tcl object commands whose client data points at a
     * CommandFunction owned by this object, so a command stays valid for as long as the interpreter does or
     * until delete_command is called. A command that is deleted while it runs is freed once it returns. A C++
     * exception escaping a command becomes a Tcl error carrying the exception text.
     */
    struct TCLINTER_EXPORT TclInterpreter final : Interpreter {
        /**
         * Establish one interpreter session. Mirrors the native ``create`` entry point: sets ``argv0``, ``argv``
         * (``-sync``, ``-use``), ``env(DISPLAY)`` and ``tcl_interactive``, then runs ``Tcl_Init`` and, when
         * ``init_tk`` is set, ``Tk_Init``.
         * @throws InterpreterError when either initialisation step fails
         */
        static interpreter_u_ptr create(const InterpreterOptions &options);

        ~TclInterpreter() override;

        TclInterpreter(const TclInterpreter &) = delete;
        TclInterpreter &operator=(const TclInterpreter &) = delete;

        std::string call(const Tokens &tokens) override;

        [[nodiscard]] Tokens split_list(std::string_view list) const override;

        void create_command(const std::string &name, CommandFunction function) override;

        void delete_command(const std::string &name) override;

        void set_trace(command_tracer_s_ptr tracer) override;

        [[nodiscard]] bool tk_loaded() const noexcept { return _tk_loaded; }

        // The client data of one Tcl command
        struct Command;

    private:
        explicit TclInterpreter(Tcl_Interp *interp);

        [[nodiscard]] std::string result_string() const;

        Tcl_Interp *_interp;
        bool _tk_loaded{false};
        command_tracer_s_ptr _tracer{};
        std::unordered_map<std::string, std::shared_ptr<Command>> _commands{};
    };
} // namespace tclinter

#endif // TCLINTER_TCL_INTERPRETER_H

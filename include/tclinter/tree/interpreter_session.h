#ifndef TCLINTER_INTERPRETER_SESSION_H
#define TCLINTER_INTERPRETER_SESSION_H

#include <tclinter/interpreter/interpreter.h>
#include <tclinter/tree/child_set.h>
#include <tclinter/tree/container.h>
#include <tclinter/tree/instance_tracker.h>
#include <tclinter/types/command_registry.h>
#include <tclinter/util/write_once.h>

namespace tclinter {
    struct SessionOptions {
        // The name of the class in the program code, also the default tree-path name ("Root" -> ".root")
        std::string class_name{"Root"};
        std::optional<std::string> path_name{};
        // Attached to the interpreter as soon as the session has one
        command_tracer_s_ptr tracer{};
    };

    /**
     * The root of an object tree, bound to one native interpreter.
     *
     * The interpreter handle and the tree-path name are write-once: assigning either a second time throws
     * InstantiatedError and keeps the value already held. The command registry is created together with the
     * handle.
     *
     * Teardown (destroy()) deletes every registered command, destroys every child widget, sends
     * ``destroy path_name`` and finally removes the session from the pool that holds it.
     */
    struct TCLINTER_EXPORT InterpreterSession : Container, std::enable_shared_from_this<InterpreterSession> {
        /**
         * A session without a handle yet, assign one with set_interpreter.
         */
        explicit InterpreterSession(SessionOptions options = {});

        InterpreterSession(interpreter_u_ptr interpreter, SessionOptions options = {});

        /**
         * Create a Tcl backed session. An empty ``base_name`` is replaced by the running program's file name.
         */
        static interpreter_session_s_ptr create(InterpreterOptions interpreter_options = {},
                                                SessionOptions options = {});

        /**
         * Performs destroy() when the owner did not, reporting failures on stderr.
         */
        ~InterpreterSession() override;

        InterpreterSession(const InterpreterSession &) = delete;
        InterpreterSession &operator=(const InterpreterSession &) = delete;

        /**
         * @throws InstantiatedError when the session already has a handle
         */
        void set_interpreter(interpreter_u_ptr interpreter);

        /**
         * @throws InstantiatedError when the session already has a name
         */
        void set_path_name(std::string path_name);

        void destroy();

        [[nodiscard]] interpreter_ptr interpreter() const override;

        [[nodiscard]] bool has_path_name() const override { return _path_name.has_value(); }

        [[nodiscard]] const std::string &path_name() const override { return _path_name.get(); }

        [[nodiscard]] ChildSet &children() override { return _children; }

        [[nodiscard]] const ChildSet &children() const { return _children; }

        [[nodiscard]] InstanceTracker &instance_tracker() override { return _tracker; }

        [[nodiscard]] bool is_destroyed() const override { return _destroyed; }

        /**
         * The registry for top-level bindings.
         * @throws LookupError while the session has no handle
         */
        [[nodiscard]] CommandRegistry &commands();

        [[nodiscard]] const std::string &class_name() const noexcept { return _class_name; }

        /**
         * Convenience pass through to the interpreter.
         */
        std::string call(const Tokens &tokens);

        [[nodiscard]] session_pool_ptr pool() const noexcept { return _pool; }

    private:
        friend struct SessionPool;

        std::string _class_name;
        command_tracer_s_ptr _tracer;
        // Declaration order is teardown order in reverse: widgets go before the registry, the registry before the
        // interpreter they both talk to.
        WriteOnce<interpreter_u_ptr> _interpreter;
        WriteOnce<std::unique_ptr<CommandRegistry>> _commands;
        WriteOnce<std::string> _path_name;
        InstanceTracker _tracker{};
        ChildSet _children{};
        session_pool_ptr _pool{nullptr};
        bool _destroyed{false};
    };
} // namespace tclinter

#endif // TCLINTER_INTERPRETER_SESSION_H

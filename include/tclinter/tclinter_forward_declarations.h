#ifndef TCLINTER_FORWARD_DECLARATIONS_H
#define TCLINTER_FORWARD_DECLARATIONS_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tclinter {
    // Tokens - the flat argument list of one interpreter instruction
    using Tokens = std::vector<std::string>;

    // Interpreter - owned by the session as unique_ptr, referenced raw everywhere below it
    struct Interpreter;
    using interpreter_ptr = Interpreter*;
    using interpreter_u_ptr = std::unique_ptr<Interpreter>;

    // CommandTracer - shared between the session and whoever configured it
    struct CommandTracer;
    using command_tracer_s_ptr = std::shared_ptr<CommandTracer>;

    // Container - raw pointer only, never owns
    struct Container;
    using container_ptr = Container*;

    // InterpreterSession - converted to shared_ptr, the pool holds the owning reference
    struct InterpreterSession;
    using interpreter_session_ptr = InterpreterSession*;
    using interpreter_session_s_ptr = std::shared_ptr<InterpreterSession>;

    // SessionPool - raw pointer only
    struct SessionPool;
    using session_pool_ptr = SessionPool*;

    // Widget - owned by the ChildSet of its parent
    struct Widget;
    using widget_ptr = Widget*;
    using widget_u_ptr = std::unique_ptr<Widget>;

    struct ChildSet;
    struct InstanceTracker;
    struct CommandRegistry;
    struct CallbackGroup;
} // namespace tclinter

#endif // TCLINTER_FORWARD_DECLARATIONS_H

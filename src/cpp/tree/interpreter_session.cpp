#include <tclinter/interpreter/tcl_interpreter.h>
#include <tclinter/tree/interpreter_session.h>
#include <tclinter/tree/session_pool.h>
#include <tclinter/util/string_utils.h>

#include <cstdio>

namespace tclinter {
    InterpreterSession::InterpreterSession(SessionOptions options)
        : _class_name{std::move(options.class_name)}, _tracer{std::move(options.tracer)},
          _interpreter{fmt::format("{} interpreter", _class_name)},
          _commands{fmt::format("{} commands", _class_name)},
          _path_name{fmt::format("{} path_name", _class_name)} {
        _path_name.set(options.path_name.has_value() ? *options.path_name : "." + to_lower(_class_name));
    }

    InterpreterSession::InterpreterSession(interpreter_u_ptr interpreter, SessionOptions options)
        : InterpreterSession(std::move(options)) {
        set_interpreter(std::move(interpreter));
    }

    interpreter_session_s_ptr InterpreterSession::create(InterpreterOptions interpreter_options, SessionOptions options) {
        if (interpreter_options.base_name.empty()) {
            interpreter_options.base_name = running_file_name(program_path(), {".py", ".pyc"});
        }
        interpreter_options.class_name = options.class_name;
        return std::make_shared<InterpreterSession>(TclInterpreter::create(interpreter_options), std::move(options));
    }

    InterpreterSession::~InterpreterSession() {
        if (_destroyed || !_interpreter.has_value()) { return; }
        try {
            destroy();
        } catch (const std::exception &e) {
            // Destructors must not throw. The widgets and commands are still released by their own destructors.
            fmt::print(stderr, "Warning: exception while destroying session {}: {}\n",
                       _path_name.has_value() ? _path_name.get() : _class_name, e.what());
        }
    }

    void InterpreterSession::set_interpreter(interpreter_u_ptr interpreter) {
        if (!interpreter) { throw_error<StructuralError>("{} cannot be given an empty interpreter", _class_name); }
        _interpreter.set(std::move(interpreter));
        auto &handle = *_interpreter.get();
        _commands.set(std::make_unique<CommandRegistry>(handle));
        if (_tracer) { handle.set_trace(_tracer); }
    }

    void InterpreterSession::set_path_name(std::string path_name) { _path_name.set(std::move(path_name)); }

    interpreter_ptr InterpreterSession::interpreter() const {
        return _interpreter.has_value() ? _interpreter.get().get() : nullptr;
    }

    CommandRegistry &InterpreterSession::commands() { return *_commands.get(); }

    std::string InterpreterSession::call(const Tokens &tokens) {
        auto *handle = interpreter();
        if (handle == nullptr) { throw_error<StructuralError>("{} has no interpreter", _class_name); }
        return handle->call(tokens);
    }

    void InterpreterSession::destroy() {
        if (_destroyed) { return; }
        // The pool may hold the last reference, keep this alive until the teardown is complete
        auto keep_alive = weak_from_this().lock();

        if (_commands.has_value()) { _commands.get()->release_all(); }
        _children.destroy_all();
        if (auto *handle = interpreter(); handle != nullptr) { handle->call({"destroy", path_name()}); }
        _destroyed = true;

        if (_pool != nullptr) { auto released = _pool->release(*this); }
    }
} // namespace tclinter

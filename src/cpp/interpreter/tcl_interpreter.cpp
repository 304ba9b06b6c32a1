#include <tclinter/interpreter/tcl_interpreter.h>
#include <tclinter/util/scope.h>

#include <tcl.h>
#include <tk.h>

#include <cctype>
#include <mutex>

namespace tclinter {
    struct TclInterpreter::Command : std::enable_shared_from_this<Command> {
        explicit Command(CommandFunction function_) : function{std::move(function_)} {}

        CommandFunction function;
    };

    namespace {
        std::once_flag find_executable_once;

        Tcl_Obj *to_result_obj(const Tokens &words) {
            // A single word is returned as is so that "hello world" does not come back as "{hello world}"
            if (words.size() == 1) { return Tcl_NewStringObj(words.front().data(), static_cast<int>(words.front().size())); }
            Tcl_Obj *list = Tcl_NewListObj(0, nullptr);
            for (const auto &word : words) {
                Tcl_ListObjAppendElement(nullptr, list, Tcl_NewStringObj(word.data(), static_cast<int>(word.size())));
            }
            return list;
        }

        int invoke_command(ClientData client_data, Tcl_Interp *interp, int objc, Tcl_Obj *const objv[]) {
            // delete_command may run from inside the call and drop the interpreter's reference
            auto command = static_cast<TclInterpreter::Command *>(client_data)->shared_from_this();
            auto &function = command->function;
            Tokens arguments;
            arguments.reserve(objc > 1 ? static_cast<std::size_t>(objc - 1) : 0);
            for (int i = 1; i < objc; ++i) { arguments.emplace_back(Tcl_GetString(objv[i])); }

            try {
                Tcl_SetObjResult(interp, to_result_obj(function(arguments)));
                return TCL_OK;
            } catch (const std::exception &e) {
                Tcl_SetObjResult(interp, Tcl_NewStringObj(e.what(), -1));
                return TCL_ERROR;
            }
        }
    } // namespace

    interpreter_u_ptr TclInterpreter::create(const InterpreterOptions &options) {
        std::call_once(find_executable_once, [] { Tcl_FindExecutable(nullptr); });

        Tcl_Interp *interp = Tcl_CreateInterp();
        if (interp == nullptr) { throw_error<InterpreterError>("Tcl_CreateInterp failed"); }
        std::unique_ptr<TclInterpreter> self{new TclInterpreter(interp)};

        Tcl_SetVar(interp, "tcl_interactive", options.interactive ? "1" : "0", TCL_GLOBAL_ONLY);

        std::string argv0 = options.class_name;
        if (!argv0.empty() && std::isupper(static_cast<unsigned char>(argv0.front()))) {
            argv0.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(argv0.front())));
        }
        Tcl_SetVar(interp, "argv0", argv0.c_str(), TCL_GLOBAL_ONLY);

        Tokens argv;
        if (options.sync) { argv.emplace_back("-sync"); }
        if (options.use.has_value()) {
            argv.emplace_back("-use");
            argv.emplace_back(*options.use);
        }
        Tcl_Obj *argv_obj = Tcl_NewListObj(0, nullptr);
        for (const auto &arg : argv) {
            Tcl_ListObjAppendElement(nullptr, argv_obj, Tcl_NewStringObj(arg.data(), static_cast<int>(arg.size())));
        }
        Tcl_SetVar2Ex(interp, "argv", nullptr, argv_obj, TCL_GLOBAL_ONLY);

        if (options.screen_name.has_value()) {
            Tcl_SetVar2(interp, "env", "DISPLAY", options.screen_name->c_str(), TCL_GLOBAL_ONLY);
        }

        if (Tcl_Init(interp) != TCL_OK) {
            throw_error<InterpreterError>("Tcl_Init failed: {}", self->result_string());
        }

        if (options.init_tk) {
            if (Tk_Init(interp) != TCL_OK) {
                throw_error<InterpreterError>("Tk_Init failed: {}", self->result_string());
            }
            self->_tk_loaded = true;
            if (!options.base_name.empty()) { self->call({"tk", "appname", options.base_name}); }
        }

        return self;
    }

    TclInterpreter::TclInterpreter(Tcl_Interp *interp) : _interp{interp} {}

    TclInterpreter::~TclInterpreter() {
        // Commands still registered keep pointing into _commands until the interpreter is gone
        Tcl_DeleteInterp(_interp);
    }

    std::string TclInterpreter::result_string() const { return Tcl_GetStringResult(_interp); }

    std::string TclInterpreter::call(const Tokens &tokens) {
        if (tokens.empty()) { throw_error<InterpreterError>("Cannot execute an empty instruction"); }
        if (_tracer) { _tracer->on_before_call(tokens); }

        std::vector<Tcl_Obj *> objv;
        objv.reserve(tokens.size());
        auto release_objects = make_scope_exit([&objv] {
            for (auto *obj : objv) { Tcl_DecrRefCount(obj); }
        });
        for (const auto &token : tokens) {
            Tcl_Obj *obj = Tcl_NewStringObj(token.data(), static_cast<int>(token.size()));
            Tcl_IncrRefCount(obj);
            objv.push_back(obj);
        }

        int code = Tcl_EvalObjv(_interp, static_cast<int>(objv.size()), objv.data(), TCL_EVAL_DIRECT | TCL_EVAL_GLOBAL);
        auto result = result_string();
        if (code == TCL_ERROR) {
            if (_tracer) { _tracer->on_call_failed(tokens, result); }
            throw_error<InterpreterError>("{}: {}", tokens.front(), result);
        }
        if (_tracer) { _tracer->on_after_call(tokens, result); }
        return result;
    }

    Tokens TclInterpreter::split_list(std::string_view list) const {
        std::string literal{list};
        int count{0};
        const char **elements{nullptr};
        if (Tcl_SplitList(_interp, literal.c_str(), &count, &elements) != TCL_OK) {
            throw_error<InterpreterError>("Invalid list literal '{}': {}", literal, result_string());
        }
        auto free_elements = make_scope_exit([&elements] { Tcl_Free(reinterpret_cast<char *>(elements)); });
        return Tokens(elements, elements + count);
    }

    void TclInterpreter::create_command(const std::string &name, CommandFunction function) {
        auto stored = std::make_shared<Command>(std::move(function));
        if (Tcl_CreateObjCommand(_interp, name.c_str(), &invoke_command, stored.get(), nullptr) == nullptr) {
            throw_error<InterpreterError>("Could not create command '{}': {}", name, result_string());
        }
        _commands[name] = std::move(stored);
    }

    void TclInterpreter::delete_command(const std::string &name) {
        if (Tcl_DeleteCommand(_interp, name.c_str()) != 0) {
            throw_error<InterpreterError>("Can't delete Tcl command '{}'", name);
        }
        _commands.erase(name);
    }

    void TclInterpreter::set_trace(command_tracer_s_ptr tracer) { _tracer = std::move(tracer); }
} // namespace tclinter

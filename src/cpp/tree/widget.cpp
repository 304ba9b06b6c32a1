#include <tclinter/tree/widget.h>
#include <tclinter/util/string_utils.h>

#include <algorithm>

namespace tclinter {
    namespace {
        std::optional<std::string> take_name_option(Options &options) {
            auto it = std::find_if(options.begin(), options.end(), [](const Option &o) { return o.first == "name"; });
            if (it == options.end()) { return std::nullopt; }

            const auto *flag = std::get_if<FlagValue>(&it->second);
            if (flag == nullptr || flag->tokens.size() != 1) {
                throw_error<UnsupportedTypeError>("The name option must be a single word");
            }
            auto name = flag->tokens.front();
            options.erase(it);
            if (name.empty()) { return std::nullopt; }
            return name;
        }
    } // namespace

    Widget::Widget(Container &parent, std::string class_name, std::string kind, Options options)
        : _parent{"Widget parent"}, _interpreter{&require_parent_interpreter(parent)},
          _tracker{&parent.instance_tracker()}, _class_name{std::move(class_name)}, _kind{std::move(kind)},
          _path_name{"Widget path_name"}, _commands{*_interpreter} {
        _parent.set(&parent);

        auto local_name = take_name_option(options);
        if (!local_name.has_value()) {
            auto index = _tracker->next_index(_class_name);
            local_name = to_lower(_class_name);
            if (index != 0) { *local_name += std::to_string(index); }
            _instance_index = index;
        }
        _path_name.set(fmt::format("{}!{}.", parent.path_name(), *local_name));

        _commands.apply(options);

        Tokens instruction{_kind, path_name()};
        auto flags = _commands.flag_tokens(options);
        instruction.insert(instruction.end(), flags.begin(), flags.end());
        _interpreter->call(instruction);

        _tracker->add(_class_name, *this, _instance_index);
    }

    Widget::~Widget() {
        if (!_destroyed) { _tracker->remove(_class_name, *this); }
    }

    void Widget::destroy() {
        if (_destroyed) { return; }

        _children.destroy_all();

        _destroyed = true;
        _tracker->remove(_class_name, *this);
        // Keeps this widget alive until the end of the teardown, it is freed on return
        auto self = parent().children().release(*this);
        _commands.release_all();
        _interpreter->call({"destroy", path_name()});
    }

    void Widget::configure(const Options &options) {
        if (_destroyed) { throw_error<StructuralError>("Cannot configure destroyed widget {}", path_name()); }
        _commands.apply(options);

        auto flags = _commands.flag_tokens(options);
        if (flags.empty()) { return; }
        Tokens instruction{path_name(), "configure"};
        instruction.insert(instruction.end(), flags.begin(), flags.end());
        _interpreter->call(instruction);
    }

    std::string Widget::cget(const std::string &key) const {
        return _interpreter->call({path_name(), "cget", "-" + key});
    }

    void Widget::set_parent(Container &parent) { _parent.set(&parent); }

    void Widget::set_path_name(std::string path_name) { _path_name.set(std::move(path_name)); }
} // namespace tclinter

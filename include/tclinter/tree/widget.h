#ifndef TCLINTER_WIDGET_H
#define TCLINTER_WIDGET_H

#include <tclinter/tree/child_set.h>
#include <tclinter/tree/container.h>
#include <tclinter/tree/instance_tracker.h>
#include <tclinter/tree/session_pool.h>
#include <tclinter/types/command_registry.h>
#include <tclinter/util/write_once.h>

namespace tclinter {
    /**
     * One interpreter-side display object, a non-root node of the tree.
     *
     * The widget's tree-path name is ``parent.path_name() + "!" + localname + "."``. ``localname`` is the
     * ``name`` option when one is given, otherwise the lower-cased class name followed by the instance index the
     * InstanceTracker hands out (no suffix for index 0).
     *
     * Construction sends exactly one creation instruction, ``kind path_name -flag value...``, built from the
     * flag options in the order given. Callback options are registered as interpreter commands, aliased under
     * their key, and never show up as flags.
     *
     * Widgets are owned by the ChildSet of their parent, use create() to build one.
     */
    struct TCLINTER_EXPORT Widget : Container {
        /**
         * @throws StructuralError when the parent cannot take children
         * @throws UnsupportedTypeError when the ``name`` option is not a single word, or a callback group is empty
         * @throws InterpreterError when the interpreter rejects the creation instruction
         */
        Widget(Container &parent, std::string class_name, std::string kind, Options options = {});

        /**
         * Releases what destroy() did not get to, without sending the destroy instruction.
         */
        ~Widget() override;

        Widget(const Widget &) = delete;
        Widget &operator=(const Widget &) = delete;

        /**
         * Build a widget owned by ``parent`` and return it.
         */
        template<typename W = Widget, typename... Args>
        static W &create(Container &parent, Args &&...args) {
            auto widget = std::make_unique<W>(parent, std::forward<Args>(args)...);
            auto &result = *widget;
            parent.children().adopt(std::move(widget));
            return result;
        }

        /**
         * Build a widget under the default session of ``pool``, creating that session when the pool is empty.
         */
        template<typename W = Widget, typename... Args>
        static W &create(SessionPool &pool, Args &&...args) {
            Container &parent = pool.get_or_create_default();
            return create<W>(parent, std::forward<Args>(args)...);
        }

        /**
         * Tear the widget down: children first (post-order), then the widget leaves the instance tracker and its
         * parent, its commands are deleted and finally ``destroy path_name`` is sent. The widget is freed by the
         * time this returns. Calling it again does nothing.
         */
        void destroy();

        /**
         * Register more options and send ``path_name configure -flag value...`` for the flag options.
         */
        void configure(const Options &options);

        /**
         * The value of one configuration option, as the interpreter reports it.
         */
        [[nodiscard]] std::string cget(const std::string &key) const;

        [[nodiscard]] interpreter_ptr interpreter() const override { return _interpreter; }

        [[nodiscard]] bool has_path_name() const override { return _path_name.has_value(); }

        [[nodiscard]] const std::string &path_name() const override { return _path_name.get(); }

        [[nodiscard]] ChildSet &children() override { return _children; }

        [[nodiscard]] const ChildSet &children() const { return _children; }

        [[nodiscard]] InstanceTracker &instance_tracker() override { return *_tracker; }

        [[nodiscard]] bool is_destroyed() const override { return _destroyed; }

        [[nodiscard]] Container &parent() const { return *_parent.get(); }

        /**
         * @throws InstantiatedError always, the parent is fixed at construction
         */
        void set_parent(Container &parent);

        /**
         * @throws InstantiatedError always, the name is fixed at construction
         */
        void set_path_name(std::string path_name);

        [[nodiscard]] const std::string &class_name() const noexcept { return _class_name; }

        [[nodiscard]] const std::string &kind() const noexcept { return _kind; }

        /**
         * The naming index taken from the tracker, std::nullopt for explicitly named widgets.
         */
        [[nodiscard]] const std::optional<std::size_t> &instance_index() const noexcept { return _instance_index; }

        [[nodiscard]] CommandRegistry &commands() noexcept { return _commands; }

        [[nodiscard]] const CommandRegistry &commands() const noexcept { return _commands; }

    private:
        WriteOnce<container_ptr> _parent;
        interpreter_ptr _interpreter;
        InstanceTracker *_tracker;
        std::string _class_name;
        std::string _kind;
        std::optional<std::size_t> _instance_index{};
        WriteOnce<std::string> _path_name;
        CommandRegistry _commands;
        ChildSet _children{};
        bool _destroyed{false};
    };
} // namespace tclinter

#endif // TCLINTER_WIDGET_H

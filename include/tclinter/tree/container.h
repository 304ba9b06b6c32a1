#ifndef TCLINTER_CONTAINER_H
#define TCLINTER_CONTAINER_H

#include <tclinter/tclinter_base.h>

namespace tclinter {
    /**
     * The contract a node must satisfy to parent widgets: it owns a set of children, exposes the interpreter its
     * children share and the tree-path name their names are derived from.
     */
    struct TCLINTER_EXPORT Container {
        virtual ~Container() = default;

        /**
         * The interpreter shared by this subtree, nullptr while no handle has been assigned.
         */
        [[nodiscard]] virtual interpreter_ptr interpreter() const = 0;

        [[nodiscard]] virtual bool has_path_name() const = 0;

        /**
         * @throws LookupError while no name has been assigned
         */
        [[nodiscard]] virtual const std::string &path_name() const = 0;

        [[nodiscard]] virtual ChildSet &children() = 0;

        [[nodiscard]] virtual InstanceTracker &instance_tracker() = 0;

        [[nodiscard]] virtual bool is_destroyed() const = 0;
    };

    /**
     * The interpreter of a parent that is able to take a new child.
     * @throws StructuralError when the parent has been destroyed, has no interpreter or has no tree-path name
     */
    [[nodiscard]] TCLINTER_EXPORT Interpreter &require_parent_interpreter(const Container &parent);
} // namespace tclinter

#endif // TCLINTER_CONTAINER_H

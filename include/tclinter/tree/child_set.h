#ifndef TCLINTER_CHILD_SET_H
#define TCLINTER_CHILD_SET_H

#include <tclinter/tclinter_base.h>

namespace tclinter {
    /**
     * The widgets owned by one node, in creation order.
     *
     * Releasing the set (by destruction) frees the widgets without sending any instruction; destroy_all() is the
     * teardown that goes through each widget's destroy().
     */
    struct TCLINTER_EXPORT ChildSet {
        ChildSet();

        ChildSet(const ChildSet &) = delete;
        ChildSet &operator=(const ChildSet &) = delete;

        ~ChildSet();

        /**
         * Take ownership of a child.
         * @throws StructuralError when the widget is already a member
         */
        Widget &adopt(widget_u_ptr child);

        /**
         * Hand ownership of a member back to the caller, nullptr when it is not a member.
         */
        [[nodiscard]] widget_u_ptr release(const Widget &child);

        [[nodiscard]] bool contains(const Widget &child) const;

        [[nodiscard]] std::size_t size() const noexcept { return _children.size(); }

        [[nodiscard]] bool empty() const noexcept { return _children.empty(); }

        /**
         * A snapshot of the members, oldest first.
         */
        [[nodiscard]] std::vector<widget_ptr> members() const;

        /**
         * Destroy every member, most recently created first. Each member unwinds its own subtree before it goes.
         */
        void destroy_all();

    private:
        std::vector<widget_u_ptr> _children{};
    };
} // namespace tclinter

#endif // TCLINTER_CHILD_SET_H

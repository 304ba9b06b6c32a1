#ifndef TCLINTER_INSTANCE_TRACKER_H
#define TCLINTER_INSTANCE_TRACKER_H

#include <tclinter/tclinter_base.h>

#include <optional>
#include <unordered_map>

namespace tclinter {
    /**
     * Live widgets per widget class, used to derive collision free default names.
     *
     * The index handed out for a class is the number of live instances of that class, moved past any index a
     * live instance still holds. The first instance of a class therefore gets index 0 (and an unsuffixed name),
     * the second index 1, and a destroyed instance never causes a live name to be handed out twice.
     */
    struct TCLINTER_EXPORT InstanceTracker {
        [[nodiscard]] std::size_t next_index(const std::string &class_name) const;

        /**
         * @param index the naming index the widget took, std::nullopt when it was named explicitly
         */
        void add(const std::string &class_name, const Widget &widget, std::optional<std::size_t> index);

        /**
         * Forget a widget, does nothing when it is not tracked.
         */
        void remove(const std::string &class_name, const Widget &widget) noexcept;

        [[nodiscard]] std::size_t count(const std::string &class_name) const;

        [[nodiscard]] bool contains(const std::string &class_name, const Widget &widget) const;

        [[nodiscard]] std::vector<const Widget *> instances(const std::string &class_name) const;

    private:
        struct Entry {
            const Widget *widget;
            std::optional<std::size_t> index;
        };

        std::unordered_map<std::string, std::vector<Entry>> _instances{};
    };
} // namespace tclinter

#endif // TCLINTER_INSTANCE_TRACKER_H

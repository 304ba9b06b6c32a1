#include <tclinter/tree/instance_tracker.h>

#include <algorithm>

namespace tclinter {
    std::size_t InstanceTracker::next_index(const std::string &class_name) const {
        auto it = _instances.find(class_name);
        if (it == _instances.end()) { return 0; }

        const auto &entries = it->second;
        auto taken = [&entries](std::size_t index) {
            return std::any_of(entries.begin(), entries.end(), [index](const Entry &e) { return e.index == index; });
        };
        std::size_t index = entries.size();
        while (taken(index)) { ++index; }
        return index;
    }

    void InstanceTracker::add(const std::string &class_name, const Widget &widget, std::optional<std::size_t> index) {
        if (contains(class_name, widget)) { throw_error<StructuralError>("Widget is already tracked as a {}", class_name); }
        _instances[class_name].push_back(Entry{&widget, index});
    }

    void InstanceTracker::remove(const std::string &class_name, const Widget &widget) noexcept {
        auto it = _instances.find(class_name);
        if (it == _instances.end()) { return; }
        std::erase_if(it->second, [&widget](const Entry &e) { return e.widget == &widget; });
        if (it->second.empty()) { _instances.erase(it); }
    }

    std::size_t InstanceTracker::count(const std::string &class_name) const {
        auto it = _instances.find(class_name);
        return it == _instances.end() ? 0 : it->second.size();
    }

    bool InstanceTracker::contains(const std::string &class_name, const Widget &widget) const {
        auto it = _instances.find(class_name);
        if (it == _instances.end()) { return false; }
        return std::any_of(it->second.begin(), it->second.end(), [&widget](const Entry &e) { return e.widget == &widget; });
    }

    std::vector<const Widget *> InstanceTracker::instances(const std::string &class_name) const {
        std::vector<const Widget *> result;
        if (auto it = _instances.find(class_name); it != _instances.end()) {
            for (const auto &entry : it->second) { result.push_back(entry.widget); }
        }
        return result;
    }
} // namespace tclinter

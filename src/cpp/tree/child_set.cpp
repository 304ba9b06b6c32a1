#include <tclinter/tree/child_set.h>
#include <tclinter/tree/widget.h>

#include <algorithm>

namespace tclinter {
    ChildSet::ChildSet() = default;

    ChildSet::~ChildSet() = default;

    Widget &ChildSet::adopt(widget_u_ptr child) {
        if (!child) { throw_error<StructuralError>("Cannot adopt an empty widget"); }
        if (contains(*child)) { throw_error<StructuralError>("{} is already a child", child->path_name()); }
        return *_children.emplace_back(std::move(child));
    }

    widget_u_ptr ChildSet::release(const Widget &child) {
        auto it = std::find_if(_children.begin(), _children.end(), [&](const auto &c) { return c.get() == &child; });
        if (it == _children.end()) { return nullptr; }
        auto released = std::move(*it);
        _children.erase(it);
        return released;
    }

    bool ChildSet::contains(const Widget &child) const {
        return std::any_of(_children.begin(), _children.end(), [&](const auto &c) { return c.get() == &child; });
    }

    std::vector<widget_ptr> ChildSet::members() const {
        std::vector<widget_ptr> result;
        result.reserve(_children.size());
        for (const auto &child : _children) { result.push_back(child.get()); }
        return result;
    }

    void ChildSet::destroy_all() {
        while (!_children.empty()) {
            auto count = _children.size();
            _children.back()->destroy();
            // destroy() normally takes the widget out of this set, drop it here if it did not
            if (_children.size() == count) { _children.pop_back(); }
        }
    }
} // namespace tclinter

#include <tclinter/types/callback_group.h>

#include <algorithm>

namespace tclinter {
    CallbackGroup::CallbackGroup(std::initializer_list<Callback> functions) : _functions(functions) {}

    CallbackGroup::CallbackGroup(std::vector<Callback> functions, std::string name)
        : _functions{std::move(functions)}, _name{std::move(name)} {}

    Tokens CallbackGroup::operator()(const Tokens &arguments) const {
        Tokens result{arguments};
        for (auto it = _functions.rbegin(); it != _functions.rend(); ++it) { result = (*it)(result); }
        return result;
    }

    void CallbackGroup::validate() const {
        if (_functions.empty()) { throw_error<UnsupportedTypeError>("A callback group needs at least one callable"); }
        if (std::any_of(_functions.begin(), _functions.end(), [](const Callback &f) { return !f; })) {
            throw_error<UnsupportedTypeError>("Callback group '{}' contains an empty callable", _name);
        }
    }
} // namespace tclinter

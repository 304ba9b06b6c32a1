#include <tclinter/tree/container.h>

namespace tclinter {
    Interpreter &require_parent_interpreter(const Container &parent) {
        if (parent.is_destroyed()) { throw_error<StructuralError>("Cannot add a child to a destroyed parent"); }
        auto *interpreter = parent.interpreter();
        if (interpreter == nullptr) { throw_error<StructuralError>("The parent does not expose an interpreter"); }
        if (!parent.has_path_name()) { throw_error<StructuralError>("The parent does not have a tree-path name"); }
        return *interpreter;
    }
} // namespace tclinter

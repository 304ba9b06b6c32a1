#include <tclinter/tree/window.h>

namespace tclinter {
    Window::Window(Container &parent, Options options) : Widget(parent, "Window", "toplevel", std::move(options)) {}
} // namespace tclinter

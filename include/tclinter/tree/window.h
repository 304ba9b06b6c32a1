#ifndef TCLINTER_WINDOW_H
#define TCLINTER_WINDOW_H

#include <tclinter/tree/widget.h>

namespace tclinter {
    /**
     * A top level window, created with the ``toplevel`` command.
     */
    struct TCLINTER_EXPORT Window : Widget {
        explicit Window(Container &parent, Options options = {});
    };
} // namespace tclinter

#endif // TCLINTER_WINDOW_H

#ifndef TCLINTER_STRING_UTILS_H
#define TCLINTER_STRING_UTILS_H

#include <tclinter/tclinter_export.h>

#include <string>
#include <string_view>
#include <vector>

namespace tclinter {
    [[nodiscard]] TCLINTER_EXPORT std::string to_lower(std::string_view value);

    /**
     * The file name of a program path, with the extension removed when it is one of ``exempt``.
     * ``running_file_name("/usr/bin/app.py", {".py"})`` is ``"app"``, ``running_file_name("/usr/bin/app.sh",
     * {".py"})`` is ``"app.sh"``.
     */
    [[nodiscard]] TCLINTER_EXPORT std::string running_file_name(std::string_view program_path,
                                                                const std::vector<std::string> &exempt = {});

    /**
     * The path of the running executable, empty when it cannot be determined.
     */
    [[nodiscard]] TCLINTER_EXPORT std::string program_path();
} // namespace tclinter

#endif  // TCLINTER_STRING_UTILS_H

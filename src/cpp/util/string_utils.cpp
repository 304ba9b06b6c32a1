#include <tclinter/util/string_utils.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace tclinter {
    std::string to_lower(std::string_view value) {
        std::string result{value};
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::string running_file_name(std::string_view program_path, const std::vector<std::string> &exempt) {
        std::filesystem::path path{program_path};
        auto full_name = path.filename().string();
        auto extension = path.extension().string();
        if (extension.empty() || std::find(exempt.begin(), exempt.end(), extension) == exempt.end()) {
            return full_name;
        }
        return path.stem().string();
    }

    std::string program_path() {
        std::error_code ec;
        auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
        return ec ? std::string{} : path.string();
    }
} // namespace tclinter

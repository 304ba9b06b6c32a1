#include <tclinter/types/value.h>

namespace tclinter {
    namespace {
        template<class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
    } // namespace

    std::string_view type_name(const Value &value) {
        return std::visit(overloaded{
                              [](bool) -> std::string_view { return "bool"; },
                              [](int64_t) -> std::string_view { return "int"; },
                              [](double) -> std::string_view { return "float"; },
                              [](const std::string &) -> std::string_view { return "str"; },
                          },
                          value);
    }

    std::string to_string(const Value &value) {
        return std::visit([](const auto &v) { return fmt::format("{}", v); }, value);
    }
} // namespace tclinter

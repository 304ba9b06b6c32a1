#pragma once

#include <tclinter/interpreter/interpreter.h>

#include <cstdint>
#include <optional>
#include <string>

namespace tclinter {

    /**
     * @brief Logs out every instruction sent to the interpreter.
     *
     * This is voluminous but can be helpful tracing down why the interpreter rejected an object or a callback.
     * Each line carries a running call number so nested calls (a command invoked from inside an instruction)
     * can be matched with their results.
     */
    class TCLINTER_EXPORT CommandTrace : public CommandTracer {
    public:
        /**
         * @brief Construct a new Command Trace object
         *
         * @param filter Used to restrict which instructions to report (substring match on the joined tokens)
         * @param before Log the instruction before it is executed
         * @param after Log the result of successful instructions
         * @param failed Log the error of rejected instructions
         */
        explicit CommandTrace(const std::optional<std::string> &filter = std::nullopt,
                              bool before = true, bool after = true, bool failed = true);

        void on_before_call(const Tokens &tokens) override;
        void on_after_call(const Tokens &tokens, const std::string &result) override;
        void on_call_failed(const Tokens &tokens, const std::string &error) override;

        [[nodiscard]] std::uint64_t call_count() const { return _call_count; }

        // Static configuration
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _before;
        bool _after;
        bool _failed;
        std::uint64_t _call_count{0};

        static bool _use_logger;

        void _print(const std::string &msg) const;
        [[nodiscard]] bool _should_log(const std::string &instruction) const;
    };

} // namespace tclinter

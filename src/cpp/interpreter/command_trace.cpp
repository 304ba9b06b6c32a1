#include <tclinter/interpreter/command_trace.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>

namespace tclinter {

    // Static member initialization
    bool CommandTrace::_use_logger = true;

    CommandTrace::CommandTrace(const std::optional<std::string> &filter, bool before, bool after, bool failed)
        : _filter(filter), _before(before), _after(after), _failed(failed) {
    }

    void CommandTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void CommandTrace::_print(const std::string &msg) const {
        std::string formatted = fmt::format("[{}] {}", _call_count, msg);
        if (_use_logger) {
            fmt::print(stderr, "{}\n", formatted);
        } else {
            fmt::print("{}\n", formatted);
        }
    }

    bool CommandTrace::_should_log(const std::string &instruction) const {
        if (!_filter.has_value()) {
            return true;
        }
        return instruction.find(_filter.value()) != std::string::npos;
    }

    void CommandTrace::on_before_call(const Tokens &tokens) {
        ++_call_count;
        if (!_before) { return; }
        auto instruction = fmt::format("{}", fmt::join(tokens, " "));
        if (_should_log(instruction)) { _print(fmt::format("Calling: {}", instruction)); }
    }

    void CommandTrace::on_after_call(const Tokens &tokens, const std::string &result) {
        if (!_after) { return; }
        auto instruction = fmt::format("{}", fmt::join(tokens, " "));
        if (_should_log(instruction)) { _print(fmt::format("Completed: {} -> '{}'", instruction, result)); }
    }

    void CommandTrace::on_call_failed(const Tokens &tokens, const std::string &error) {
        if (!_failed) { return; }
        auto instruction = fmt::format("{}", fmt::join(tokens, " "));
        if (_should_log(instruction)) { _print(fmt::format("FAILED: {} -> {}", instruction, error)); }
    }

} // namespace tclinter

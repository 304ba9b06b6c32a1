#include <tclinter/util/execution_timer.h>

#include <fmt/format.h>

#include <exception>

namespace tclinter {
    ExecutionTimer::ExecutionTimer(std::FILE *out) : _out{out}, _start{std::chrono::steady_clock::now()} {}

    ExecutionTimer::~ExecutionTimer() noexcept {
        try {
            fmt::print(_out, "Execution time: {:.10f} seconds\n", elapsed_seconds());
        } catch (const std::exception &e) {
            std::fprintf(stderr, "Warning: could not report execution time: %s\n", e.what());
        }
    }

    double ExecutionTimer::elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - _start).count();
    }
} // namespace tclinter

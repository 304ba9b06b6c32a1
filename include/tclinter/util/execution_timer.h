#ifndef TCLINTER_EXECUTION_TIMER_H
#define TCLINTER_EXECUTION_TIMER_H

#include <tclinter/tclinter_export.h>

#include <chrono>
#include <cstdio>

namespace tclinter {
    /**
     * Prints ``Execution time: <seconds> seconds`` (10 decimals) when it goes out of scope, however the scope
     * is left.
     */
    class TCLINTER_EXPORT ExecutionTimer {
    public:
        explicit ExecutionTimer(std::FILE *out = stdout);

        ~ExecutionTimer() noexcept;

        ExecutionTimer(const ExecutionTimer &) = delete;
        ExecutionTimer &operator=(const ExecutionTimer &) = delete;

        [[nodiscard]] double elapsed_seconds() const;

    private:
        std::FILE *_out;
        std::chrono::steady_clock::time_point _start;
    };
} // namespace tclinter

#endif // TCLINTER_EXECUTION_TIMER_H

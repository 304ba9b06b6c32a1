// A temporary solution for scope implementations, until std::scope_exit is available.
#ifndef TCLINTER_SCOPE_H
#define TCLINTER_SCOPE_H

#include <utility>

namespace tclinter {
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)), active_(true) {
        }

        scope_exit(scope_exit &&other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) { other.release(); }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (active_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        bool active_;
    };

    // helper deduction:
    template<class F>
    scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }
} // namespace tclinter
#endif  // TCLINTER_SCOPE_H

#ifndef TCLINTER_SESSION_POOL_H
#define TCLINTER_SESSION_POOL_H

#include <tclinter/tree/interpreter_session.h>

namespace tclinter {
    /**
     * The sessions of a process, index 0 being the default session widgets fall back to when they are not
     * given a parent.
     *
     * A pool is created by whoever needs default-session behaviour (default_session_pool() for the process wide
     * one, created on first access) and drained explicitly at shutdown. Destroying a pooled session removes it
     * from the pool. Destroying the pool without draining it leaves each session's teardown to its destructor.
     */
    struct TCLINTER_EXPORT SessionPool {
        using factory_type = std::function<interpreter_session_s_ptr()>;

        explicit SessionPool(factory_type factory = default_factory());

        ~SessionPool();

        SessionPool(const SessionPool &) = delete;
        SessionPool &operator=(const SessionPool &) = delete;

        /**
         * The session at index 0, created with the pool's factory when the pool is empty.
         */
        InterpreterSession &get_or_create_default();

        /**
         * @throws LookupError when the index is out of range
         */
        [[nodiscard]] interpreter_session_s_ptr at(std::size_t index) const;

        /**
         * Append a session and return its index.
         * @throws StructuralError when the session is destroyed or already pooled
         */
        std::size_t add(interpreter_session_s_ptr session);

        /**
         * Remove a session from the pool and hand it to the caller. Whether its subtree is empty is not checked.
         * @throws LookupError when there is no such session
         */
        interpreter_session_s_ptr release(std::size_t index = 0);

        interpreter_session_s_ptr release(const InterpreterSession &session);

        /**
         * Destroy every pooled session, oldest first.
         */
        void drain();

        [[nodiscard]] std::optional<std::size_t> index_of(const InterpreterSession &session) const;

        [[nodiscard]] std::size_t size() const noexcept { return _sessions.size(); }

        [[nodiscard]] bool empty() const noexcept { return _sessions.empty(); }

        /**
         * Builds a Tcl/Tk session with default options.
         */
        static factory_type default_factory();

    private:
        factory_type _factory;
        std::vector<interpreter_session_s_ptr> _sessions{};
    };

    /**
     * The process wide pool, created on first access. Its owner drains it at shutdown.
     */
    TCLINTER_EXPORT SessionPool &default_session_pool();
} // namespace tclinter

#endif // TCLINTER_SESSION_POOL_H

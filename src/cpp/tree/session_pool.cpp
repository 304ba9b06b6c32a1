#include <tclinter/tree/session_pool.h>

#include <algorithm>

namespace tclinter {
    SessionPool::SessionPool(factory_type factory) : _factory{std::move(factory)} {}

    SessionPool::~SessionPool() {
        for (auto &session : _sessions) { session->_pool = nullptr; }
    }

    InterpreterSession &SessionPool::get_or_create_default() {
        if (_sessions.empty()) {
            if (!_factory) { throw_error<StructuralError>("The session pool has no factory to create a default session"); }
            add(_factory());
        }
        return *_sessions.front();
    }

    interpreter_session_s_ptr SessionPool::at(std::size_t index) const {
        if (index >= _sessions.size()) {
            throw_error<LookupError>("No session at index {}, the pool holds {}", index, _sessions.size());
        }
        return _sessions[index];
    }

    std::size_t SessionPool::add(interpreter_session_s_ptr session) {
        if (!session) { throw_error<StructuralError>("Cannot pool an empty session"); }
        if (session->is_destroyed()) { throw_error<StructuralError>("Cannot pool a destroyed session"); }
        if (session->_pool != nullptr) { throw_error<StructuralError>("The session is already pooled"); }
        session->_pool = this;
        _sessions.push_back(std::move(session));
        return _sessions.size() - 1;
    }

    interpreter_session_s_ptr SessionPool::release(std::size_t index) {
        auto session = at(index);
        _sessions.erase(_sessions.begin() + static_cast<std::ptrdiff_t>(index));
        session->_pool = nullptr;
        return session;
    }

    interpreter_session_s_ptr SessionPool::release(const InterpreterSession &session) {
        auto index = index_of(session);
        if (!index.has_value()) { throw_error<LookupError>("The session {} is not in this pool", session.class_name()); }
        return release(*index);
    }

    void SessionPool::drain() {
        while (!_sessions.empty()) {
            auto session = _sessions.front();
            session->destroy();
            // A session destroyed before it was pooled does not remove itself
            if (index_of(*session).has_value()) { auto released = release(*session); }
        }
    }

    std::optional<std::size_t> SessionPool::index_of(const InterpreterSession &session) const {
        auto it = std::find_if(_sessions.begin(), _sessions.end(), [&](const auto &s) { return s.get() == &session; });
        if (it == _sessions.end()) { return std::nullopt; }
        return static_cast<std::size_t>(it - _sessions.begin());
    }

    SessionPool::factory_type SessionPool::default_factory() {
        return [] { return InterpreterSession::create(); };
    }

    SessionPool &default_session_pool() {
        static SessionPool pool;
        return pool;
    }
} // namespace tclinter

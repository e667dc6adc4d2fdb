#pragma once

/**
 * @file session.h
 * @brief Drawing session state shared with the Canvas
 *
 * The session owns the fragile flag. While it is set (for example while a
 * recorded history is being replayed) every state-changing Canvas command is
 * rejected with IrreversibleOperationError.
 */

#include <string>

namespace turtle {

class Session {
public:
    explicit Session(std::string name = "default") : m_name(std::move(name)) {}

    const std::string& name() const { return m_name; }

    bool isFragile() const { return m_fragile; }
    void setFragile(bool fragile) { m_fragile = fragile; }

    /**
     * @brief Marks the session fragile for the lifetime of the scope
     *
     * The previous flag value is restored on destruction, so scopes nest.
     */
    class FragileScope {
    public:
        explicit FragileScope(Session& session)
            : m_session(session), m_previous(session.isFragile()) {
            m_session.setFragile(true);
        }
        ~FragileScope() { m_session.setFragile(m_previous); }

        FragileScope(const FragileScope&) = delete;
        FragileScope& operator=(const FragileScope&) = delete;

    private:
        Session& m_session;
        bool m_previous;
    };

private:
    std::string m_name;
    bool m_fragile = false;
};

} // namespace turtle

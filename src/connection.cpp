#include "cluster_cpp/connection/connection.hpp"

#include <fmt/format.h>

namespace cluster_cpp {

    Connection::Connection(std::string url) : m_url(std::move(url)) {}

    bool Connection::is_dead() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_dead;
    }

    std::optional<Connection::clock::time_point> Connection::dead_since()
        const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_dead_since;
    }

    std::size_t Connection::failures() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_failures;
    }

    void Connection::mark_as_dead() {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_dead = true;
        m_dead_since = clock::now();
        ++m_failures;
    }

    void Connection::mark_as_alive() {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_dead = false;
        m_failures = 0;
    }

    std::string Connection::to_string() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return fmt::format("{} [dead={},failures={}]", m_url, m_dead,
                           m_failures);
    }

}  // namespace cluster_cpp

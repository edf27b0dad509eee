#include "cluster_cpp/connection/connection_pool.hpp"

#include <algorithm>
#include <unordered_set>

namespace cluster_cpp {

    using PoolPtr = std::shared_ptr<ConnectionPool>;

    std::vector<std::string> ConnectionPool::unique_urls(
        const std::vector<std::string>& urls) {
        std::vector<std::string> out;
        std::unordered_set<std::string> seen;
        for (const auto& u : urls) {
            if (seen.insert(u).second) out.push_back(u);
        }
        return out;
    }

    Result<PoolPtr> ConnectionPool::create(const std::vector<std::string>& urls,
                                           LoggerPtr error_log) {
        auto unique = unique_urls(urls);
        if (unique.empty()) {
            return Result<PoolPtr>::err(Error::Code::NoUsableNode,
                                        "no node URLs to build a pool from");
        }

        std::vector<ConnectionPtr> conns;
        conns.reserve(unique.size());
        for (auto& u : unique) {
            conns.push_back(std::make_shared<Connection>(std::move(u)));
        }
        return Result<PoolPtr>::ok(std::make_shared<ConnectionPool>(
            CreateTag{}, std::move(conns), std::move(error_log)));
    }

    ConnectionPool::ConnectionPool(CreateTag, std::vector<ConnectionPtr> conns,
                                   LoggerPtr error_log)
        : m_conns(std::move(conns)), m_error_log(std::move(error_log)) {}

    Result<ConnectionPool::ConnectionPtr> ConnectionPool::select() {
        std::size_t n = 0;
        {
            std::lock_guard<std::mutex> lk(m_mutex);

            n = m_conns.size();
            for (std::size_t i = 0; i < n; ++i) {
                const std::size_t idx = (m_cursor + i) % n;
                const auto& conn = m_conns[idx];
                if (!conn->is_dead()) {
                    m_cursor = (idx + 1) % n;
                    return Result<ConnectionPtr>::ok(conn);
                }
            }

            // Every node is dead: resurrect them all and let the caller retry.
            for (const auto& conn : m_conns) conn->mark_as_alive();
        }

        logging::error(m_error_log,
                       "all {} nodes marked dead; resurrecting them", n);
        return Result<ConnectionPtr>::err(Error::Code::PoolExhausted,
                                          "no alive node available");
    }

    void ConnectionPool::mark_dead(const ConnectionPtr& conn) {
        if (!conn) return;
        std::lock_guard<std::mutex> lk(m_mutex);
        conn->mark_as_dead();
    }

    void ConnectionPool::mark_alive(const ConnectionPtr& conn) {
        if (!conn) return;
        std::lock_guard<std::mutex> lk(m_mutex);
        conn->mark_as_alive();
    }

    Status ConnectionPool::replace(const std::vector<std::string>& urls) {
        auto unique = unique_urls(urls);
        if (unique.empty()) {
            return Status::err(Error::Code::NoUsableNode,
                               "refusing to replace pool with an empty list");
        }

        std::lock_guard<std::mutex> lk(m_mutex);
        std::vector<ConnectionPtr> next;
        next.reserve(unique.size());
        for (auto& u : unique) {
            auto it = std::find_if(
                m_conns.begin(), m_conns.end(),
                [&u](const ConnectionPtr& c) { return c->url() == u; });
            if (it != m_conns.end()) {
                next.push_back(*it);
            } else {
                next.push_back(std::make_shared<Connection>(std::move(u)));
            }
        }
        m_conns.swap(next);
        m_cursor = 0;
        return Status::ok();
    }

    std::vector<ConnectionPool::ConnectionPtr> ConnectionPool::snapshot()
        const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_conns;
    }

    std::vector<std::string> ConnectionPool::urls() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        std::vector<std::string> out;
        out.reserve(m_conns.size());
        for (const auto& c : m_conns) out.push_back(c->url());
        return out;
    }

    std::size_t ConnectionPool::size() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_conns.size();
    }

    ConnectionPool::ConnectionPtr ConnectionPool::find(
        std::string_view url) const {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (const auto& c : m_conns) {
            if (c->url() == url) return c;
        }
        return nullptr;
    }

}  // namespace cluster_cpp

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../logging.hpp"
#include "../result.hpp"
#include "connection.hpp"

namespace cluster_cpp {

    /**
     * Thread-safe, ordered set of cluster nodes with a round-robin selector.
     *
     * SAFETY:
     * - All public methods are thread-safe.
     * - One mutex guards the sequence and the cursor. Liveness transitions
     *   go through the pool so they are ordered with selection; the lock
     *   order is pool, then connection.
     * - No method performs I/O.
     *
     * INVARIANTS:
     * 1. The sequence is never empty.
     * 2. 0 <= cursor < size.
     * 3. URLs are unique; selection order is insertion order.
     */
    class ConnectionPool {
        // Only create() can name this, so only create() can construct.
        struct CreateTag {
            explicit CreateTag() = default;
        };

       public:
        using ConnectionPtr = std::shared_ptr<Connection>;

        /// @brief Build a pool of alive nodes from canonical URLs.
        /// Duplicate URLs are collapsed.
        /// @return NoUsableNode if `urls` is empty.
        static Result<std::shared_ptr<ConnectionPool>> create(
            const std::vector<std::string>& urls, LoggerPtr error_log = {});

        ConnectionPool(CreateTag, std::vector<ConnectionPtr> conns,
                       LoggerPtr error_log);

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /**
         * @brief Pick the next alive node, round robin.
         *
         * Scans at most size() entries starting at the cursor and moves the
         * cursor just past the node it returns. If every node is dead, all of
         * them are marked alive again and PoolExhausted is returned for this
         * call only. Resurrection leaves the cursor where it was.
         */
        Result<ConnectionPtr> select();

        void mark_dead(const ConnectionPtr& conn);
        void mark_alive(const ConnectionPtr& conn);

        /**
         * @brief Swap in a new member list.
         *
         * Nodes whose URL is already pooled keep their Connection object
         * (and liveness); new URLs start alive. The cursor is reset.
         * @return NoUsableNode and leaves the pool untouched if `urls` is
         * empty.
         */
        Status replace(const std::vector<std::string>& urls);

        /// @brief Copy of the current sequence, in selection order.
        std::vector<ConnectionPtr> snapshot() const;

        std::vector<std::string> urls() const;

        std::size_t size() const;

        /// @return nullptr if no pooled node has this URL.
        ConnectionPtr find(std::string_view url) const;

       private:
        static std::vector<std::string> unique_urls(
            const std::vector<std::string>& urls);

        mutable std::mutex m_mutex;
        std::vector<ConnectionPtr> m_conns;
        std::size_t m_cursor{0};
        LoggerPtr m_error_log;
    };

}  // namespace cluster_cpp

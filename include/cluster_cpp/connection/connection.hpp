#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace cluster_cpp {

    /**
     * @brief A node of the cluster, identified by its canonical URL.
     *
     * The URL never changes. Liveness and the failure bookkeeping change only
     * through mark_as_dead() and mark_as_alive(); all fields are guarded by a
     * private mutex so readers never observe a half-applied transition.
     */
    class Connection {
       public:
        using clock = std::chrono::system_clock;

        /// @param url Canonical node URL (see canonicalize_url()).
        explicit Connection(std::string url);

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        const std::string& url() const noexcept { return m_url; }

        bool is_dead() const;

        /// @brief When the node was last marked dead; nullopt while it has
        /// never failed.
        std::optional<clock::time_point> dead_since() const;

        /// @brief Consecutive failures since the node was last alive.
        std::size_t failures() const;

        /// @brief Take the node out of rotation and record the failure.
        void mark_as_dead();

        /// @brief Put the node back into rotation and reset the failure
        /// counter.
        void mark_as_alive();

        /// @brief e.g. `http://10.0.0.1:9200 [dead=false,failures=0]`
        std::string to_string() const;

       private:
        const std::string m_url;

        mutable std::mutex m_mutex;
        bool m_dead{false};
        std::optional<clock::time_point> m_dead_since{};
        std::size_t m_failures{0};
    };

}  // namespace cluster_cpp

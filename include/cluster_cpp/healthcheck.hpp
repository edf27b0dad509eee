#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

#include "config.hpp"
#include "connection/connection_pool.hpp"
#include "context.hpp"
#include "node_client.hpp"
#include "result.hpp"

namespace cluster_cpp {

    struct HealthCheckOptions {
        std::string path{"/"};
        /// Budget of one probe.
        std::chrono::milliseconds timeout{1000};
        std::chrono::milliseconds interval{60000};

        static HealthCheckOptions from(const ClientConfiguration& cfg);
    };

    /**
     * @brief Probes pool members with HEAD requests and records the outcome.
     *
     * A 2xx answer marks the node alive; a transport error, a timeout or any
     * other status marks it dead. Probes run outside the pool lock.
     */
    class HealthChecker {
       public:
        HealthChecker(std::shared_ptr<ConnectionPool> pool,
                      std::shared_ptr<const NodeClient> client,
                      HealthCheckOptions opts);

        /// @brief Probe one node. Does not touch the pool.
        bool check(const Context& ctx,
                   const std::shared_ptr<Connection>& conn) const;

        /// @brief Probe every member, each under its own `per_probe`
        /// timeout, and mark it alive or dead. Stops early, without
        /// marking anything, once `ctx` is done.
        void check_all(const Context& ctx,
                       std::chrono::milliseconds per_probe) const;

        /// @brief Block until any member answers 2xx.
        /// @return NoUsableNode if none did within `timeout`.
        Status wait_for_healthy(const Context& ctx,
                                std::chrono::milliseconds timeout) const;

        /// @brief Periodic driver; returns once `stop` is requested.
        void run(std::stop_token stop) const;

        const HealthCheckOptions& options() const noexcept { return m_opts; }

       private:
        std::shared_ptr<ConnectionPool> m_pool;
        std::shared_ptr<const NodeClient> m_client;
        HealthCheckOptions m_opts;
    };

}  // namespace cluster_cpp

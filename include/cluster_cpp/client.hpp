#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "connection/connection_pool.hpp"
#include "context.hpp"
#include "healthcheck.hpp"
#include "node_client.hpp"
#include "periodic_task.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "sniffer.hpp"
#include "url.hpp"

namespace cluster_cpp {

    /**
     * @brief What to send through ClusterClient::perform_request().
     */
    struct PerformRequestOptions {
        HttpMethod method{HttpMethod::Get};
        /** @brief Path relative to the node URL, e.g. "/_search". */
        std::string path{"/"};
        QueryParams params;
        RequestBody body;
        /** @brief Content-Type of the body. Defaults to application/json. */
        std::string content_type;
        /** @brief Per-request headers; they take precedence over defaults. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief Non-2xx statuses that count as success, e.g. 404. */
        std::vector<int> ignore_statuses;
    };

    /**
     * @brief Client for a cluster of interchangeable HTTP nodes.
     *
     * Keeps a pool of nodes in sync with the cluster (discovery) and with
     * their health, picks a node per request round robin, and retries
     * transport failures on other nodes.
     *
     * All methods are thread-safe.
     */
    class ClusterClient {
        // Only create() can name this, so only create() can construct.
        struct CreateTag {
            explicit CreateTag() = default;
        };

       public:
        /**
         * @brief Validate `config`, reach the cluster and start the
         * background drivers.
         *
         * With discovery enabled, blocks until a seed answers with the member
         * list (up to sniffer_timeout_startup). With health checks enabled,
         * blocks until a node answers a probe (up to
         * healthcheck_timeout_startup), then probes every node once.
         * @return NoUsableNode if the cluster could not be reached,
         * InvalidUrl or InvalidConfiguration for a bad configuration.
         */
        static Result<std::unique_ptr<ClusterClient>> create(
            ClientConfiguration config);

        ClusterClient(CreateTag, ClientConfiguration config,
                      std::shared_ptr<ConnectionPool> pool,
                      std::shared_ptr<const NodeClient> client);

        ~ClusterClient();

        ClusterClient(const ClusterClient&) = delete;
        ClusterClient& operator=(const ClusterClient&) = delete;

        ClusterClient(ClusterClient&&) = delete;
        ClusterClient& operator=(ClusterClient&&) = delete;

        /**
         * @brief Send a request to the next alive node.
         *
         * Transport failures mark the node dead and are retried on another
         * node, up to max_retries times. A non-2xx status is returned as an
         * HttpStatus error with the response attached and is never retried.
         * @return Canceled or DeadlineExceeded once `ctx` is done,
         * PoolExhausted if every node was dead, EncodingFailed if the body
         * cannot be serialized.
         */
        [[nodiscard]] Result<Response> perform_request(
            const Context& ctx, const PerformRequestOptions& opts);

        /// @brief perform_request() without cancellation.
        [[nodiscard]] Result<Response> perform_request(
            const PerformRequestOptions& opts);

        /// @brief Launch the enabled background drivers. No-op if running.
        void start();

        /// @brief Stop and join the background drivers. No-op if stopped.
        void stop();

        [[nodiscard]] bool is_running() const;

        /// @brief Snapshot of the pool, in selection order.
        [[nodiscard]] std::vector<std::shared_ptr<Connection>> connections()
            const;

        [[nodiscard]] const ClientConfiguration& config() const noexcept {
            return m_config;
        }

       private:
        bool is_ignored(const PerformRequestOptions& opts, int status) const;

        const ClientConfiguration m_config;
        std::shared_ptr<ConnectionPool> m_pool;
        std::shared_ptr<const NodeClient> m_client;
        Sniffer m_sniffer;
        HealthChecker m_health;

        mutable std::mutex m_lifecycle_mutex;
        bool m_running{false};
        std::unique_ptr<PeriodicTask> m_sniffer_task;
        std::unique_ptr<PeriodicTask> m_health_task;
    };

}  // namespace cluster_cpp

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "connection/connection_pool.hpp"
#include "context.hpp"
#include "node_client.hpp"
#include "result.hpp"

namespace cluster_cpp {

    struct SnifferOptions {
        /// Canonical seed URLs, always queried first.
        std::vector<std::string> seeds;
        std::string scheme{kDefaultScheme};
        std::string path{"/_nodes/http"};
        /// Budget of one periodic pass.
        std::chrono::milliseconds timeout{2000};
        std::chrono::milliseconds interval{std::chrono::minutes(15)};

        static SnifferOptions from(const ClientConfiguration& cfg);
    };

    /**
     * @brief Turn a published node address into `host:port`.
     *
     * Accepts `host:port`, `hostname/ip:port` (the ip is used),
     * `inet[/ip:port]`, `inet[hostname/ip:port]` and `[v6]:port`.
     * @return nullopt if no host and numeric port can be extracted.
     */
    std::optional<std::string> parse_publish_address(std::string_view address);

    /**
     * @brief Extract member URLs from a `_nodes/http` response body.
     *
     * Members are read from `nodes.<id>.http.publish_address`; members
     * without a usable address are skipped.
     * @return InvalidResponse if the body is not JSON, has no `nodes`
     * object, or yields no member at all.
     */
    Result<std::vector<std::string>> parse_nodes_response(std::string_view body,
                                                          std::string_view scheme);

    /**
     * @brief Keeps the pool in sync with the cluster membership.
     *
     * Every pass asks the seeds and the alive pool members for the member
     * list, in parallel, and swaps the first non-empty answer into the pool.
     * A failed pass leaves the pool untouched.
     */
    class Sniffer {
       public:
        Sniffer(std::shared_ptr<ConnectionPool> pool,
                std::shared_ptr<const NodeClient> client, SnifferOptions opts);

        /// @brief Ask one node for the member list.
        Result<std::vector<std::shared_ptr<Connection>>> sniff_node(
            const Context& ctx, const std::string& url) const;

        /// @brief One discovery pass under `ctx`.
        /// @return NoUsableNode if no candidate answered, or the context
        /// error if `ctx` finished first.
        Status sniff(const Context& ctx) const;

        /// @brief Repeat passes until one succeeds or `timeout` elapses.
        /// @return NoUsableNode on timeout.
        Status sniff_startup(const Context& ctx,
                             std::chrono::milliseconds timeout) const;

        /// @brief Periodic driver; returns once `stop` is requested.
        void run(std::stop_token stop) const;

        const SnifferOptions& options() const noexcept { return m_opts; }

       private:
        std::vector<std::string> candidate_urls() const;
        void report_membership_change(const std::vector<std::string>& before,
                                      const std::vector<std::string>& after) const;

        std::shared_ptr<ConnectionPool> m_pool;
        std::shared_ptr<const NodeClient> m_client;
        SnifferOptions m_opts;
    };

}  // namespace cluster_cpp

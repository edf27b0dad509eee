#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backoff.hpp"
#include "http_method.hpp"
#include "logging.hpp"
#include "middleware.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace cluster_cpp {

    inline constexpr std::string_view kDefaultUrl = "http://127.0.0.1:9200";

    /** @brief Credentials for HTTP Basic authentication. */
    struct BasicAuth {
        std::string username;
        std::string password;
    };

    /**
     * @brief Configuration for ClusterClient.
     *
     * A plain aggregate: set the fields you need, leave the rest at their
     * defaults. The client takes a copy at construction time.
     */
    struct ClientConfiguration {
        /** @brief Seed node URLs. Empty means kDefaultUrl. */
        std::vector<std::string> urls;

        /** @brief Discover cluster members through the seeds. */
        bool sniffer_enabled{true};
        /** @brief Budget for discovery during construction. */
        std::chrono::milliseconds sniffer_timeout_startup{5000};
        /** @brief Budget for each periodic discovery pass. */
        std::chrono::milliseconds sniffer_timeout{2000};
        /** @brief Pause between periodic discovery passes. */
        std::chrono::milliseconds sniffer_interval{std::chrono::minutes(15)};
        std::string sniffer_path{"/_nodes/http"};
        /** @brief Scheme used to build URLs of discovered members. */
        std::string scheme{kDefaultScheme};

        /** @brief Probe nodes with HEAD requests. */
        bool healthcheck_enabled{true};
        /** @brief Budget for the health gate during construction. */
        std::chrono::milliseconds healthcheck_timeout_startup{5000};
        /** @brief Budget for each periodic probe. */
        std::chrono::milliseconds healthcheck_timeout{1000};
        /** @brief Pause between periodic health rounds. */
        std::chrono::milliseconds healthcheck_interval{60000};
        std::string healthcheck_path{"/"};

        /** @brief Extra attempts on other nodes after a transport failure. */
        int max_retries{1};
        /** @brief Delay between attempts. Null means retry immediately. */
        BackoffPtr backoff;

        std::optional<BasicAuth> basic_auth;

        /** @brief Headers added to every request unless set per request. */
        std::map<std::string, std::string> default_headers;

        /** @brief Method used to send a GET that carries a body. */
        HttpMethod send_get_body_as{HttpMethod::Get};

        /** @brief Custom transport. Null means a BeastTransport built from
         * transport_config. */
        std::shared_ptr<Transport> transport;
        TransportConfiguration transport_config;

        /** @brief Run after the built-in headers, in order. */
        InterceptorList interceptors;

        LoggerPtr info_log;
        LoggerPtr trace_log;
        LoggerPtr error_log;
    };

    /**
     * @brief Check a configuration and bring it into canonical form.
     *
     * Seed URLs are canonicalised and de-duplicated (kDefaultUrl if none),
     * the discovery scheme is lower-cased and paths get a leading '/'.
     * @return InvalidUrl for a malformed seed, InvalidConfiguration for a
     * non-positive timeout or interval, a negative retry count or an unknown
     * scheme.
     */
    Result<ClientConfiguration> validate_configuration(ClientConfiguration cfg);

}  // namespace cluster_cpp

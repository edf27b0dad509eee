#pragma once

#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstddef>
#include <string>

#include "context.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"

namespace cluster_cpp {

    /**
     * @brief Socket level settings of the default transport.
     */
    struct TransportConfiguration {
        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"cluster_cpp/1.0"};

        /** @brief Timeout for resolving and connecting to a node. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Timeout for writing the request and reading the response. */
        std::chrono::milliseconds request_timeout{30000};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(100) * 1024U *
                                   1024U};

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};
    };

    /**
     * @brief Performs one HTTP exchange with one node.
     *
     * Implementations must be safe to call from several threads at once and
     * must return promptly once the context is done. A returned error means
     * no response was obtained; any HTTP status, including 5xx, is a
     * successful round trip.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        virtual Result<Response> round_trip(const Context& ctx,
                                            const Request& req) = 0;
    };

    /**
     * @brief Boost.Beast transport opening one connection per exchange.
     *
     * Each call drives its own io_context on the calling thread. The
     * exchange is aborted when the context is canceled or its deadline
     * passes; the socket is closed before round_trip() returns.
     */
    class BeastTransport : public Transport {
       public:
        /// @throws std::runtime_error if the TLS context cannot be set up.
        explicit BeastTransport(TransportConfiguration config = {});

        BeastTransport(const BeastTransport&) = delete;
        BeastTransport& operator=(const BeastTransport&) = delete;

        Result<Response> round_trip(const Context& ctx,
                                    const Request& req) override;

        const TransportConfiguration& config() const noexcept {
            return m_config;
        }

       private:
        TransportConfiguration m_config;
        boost::asio::ssl::context m_ssl_ctx;
    };

}  // namespace cluster_cpp

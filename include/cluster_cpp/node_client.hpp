#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "context.hpp"
#include "logging.hpp"
#include "middleware.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace cluster_cpp {

    /**
     * @brief Sends single requests to a given node.
     *
     * Shared by the request executor, discovery and health probes: every
     * exchange gets the configured headers and credentials, and is dumped to
     * the trace log. No retries and no pool bookkeeping happen here.
     */
    class NodeClient {
       public:
        NodeClient(std::shared_ptr<Transport> transport,
                   InterceptorList interceptors, Loggers loggers,
                   std::string user_agent);

        /// @brief Default headers, basic auth and custom interceptors of
        /// `cfg`, in that order.
        static InterceptorList interceptors_from(const ClientConfiguration& cfg);

        /**
         * @brief Run `req` against the node named in `req.url`.
         * @return The node's response whatever its status, or the transport
         * error. InvalidUrl if `req.url` does not parse.
         */
        Result<Response> send(const Context& ctx, Request req) const;

        const Loggers& loggers() const noexcept { return m_loggers; }

       private:
        std::shared_ptr<Transport> m_transport;
        InterceptorList m_interceptors;
        Loggers m_loggers;
        std::string m_user_agent;
    };

}  // namespace cluster_cpp

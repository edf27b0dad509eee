#include "cluster_cpp/node_client.hpp"

#include <unordered_map>

#include "cluster_cpp/url.hpp"

namespace cluster_cpp {

    NodeClient::NodeClient(std::shared_ptr<Transport> transport,
                           InterceptorList interceptors, Loggers loggers,
                           std::string user_agent)
        : m_transport(std::move(transport)),
          m_interceptors(std::move(interceptors)),
          m_loggers(std::move(loggers)),
          m_user_agent(std::move(user_agent)) {}

    InterceptorList NodeClient::interceptors_from(
        const ClientConfiguration& cfg) {
        InterceptorList out;
        if (!cfg.default_headers.empty()) {
            out.push_back(std::make_shared<DefaultHeadersInterceptor>(
                std::unordered_map<std::string, std::string>(
                    cfg.default_headers.begin(), cfg.default_headers.end())));
        }
        if (cfg.basic_auth) {
            out.push_back(std::make_shared<BasicAuthInterceptor>(
                cfg.basic_auth->username, cfg.basic_auth->password));
        }
        out.insert(out.end(), cfg.interceptors.begin(), cfg.interceptors.end());
        return out;
    }

    Result<Response> NodeClient::send(const Context& ctx, Request req) const {
        auto u_res = parse_url(req.url);
        if (u_res.has_error()) return Result<Response>::err(u_res.error());

        apply_interceptors(m_interceptors, req, u_res.value());

        // Build the dumps only when the trace level is enabled.
        const bool dump = m_loggers.trace &&
                          m_loggers.trace->should_log(spdlog::level::trace);
        if (dump) {
            logging::trace(m_loggers.trace, "{}",
                           logging::dump_request(req, m_user_agent));
        }

        auto res = m_transport->round_trip(ctx, req);

        if (dump && res.has_value()) {
            logging::trace(m_loggers.trace, "{}",
                           logging::dump_response(res.value()));
        }
        return res;
    }

}  // namespace cluster_cpp

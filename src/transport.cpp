#include "cluster_cpp/transport.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <exception>
#include <optional>
#include <stop_token>

#include "cluster_cpp/endpoint.hpp"
#include "cluster_cpp/url.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace cluster_cpp {

    namespace {

        using BeastRequest = http::request<http::string_body>;
        using Outcome = std::optional<Result<Response>>;

        Result<Response> fail(Error::Code code, const Endpoint& ep,
                              std::string_view what,
                              const beast::error_code& ec) {
            if (ec == beast::error::timeout) code = Error::Code::Timeout;
            return Result<Response>::err(
                code, std::string(what) + " " + ep.host + ":" + ep.port +
                          ": " + ec.message());
        }

        template <typename Stream>
        net::awaitable<void> write_and_read(Stream& stream, const Endpoint& ep,
                                            BeastRequest& req,
                                            std::size_t max_body_bytes,
                                            Outcome& out) {
            beast::error_code ec;
            co_await http::async_write(
                stream, req, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                out = fail(Error::Code::SendFailed, ep, "write to", ec);
                co_return;
            }

            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.body_limit(max_body_bytes);
            // HEAD responses announce a length but carry no body.
            if (req.method() == http::verb::head) parser.skip(true);

            co_await http::async_read(
                stream, buffer, parser,
                net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                out = fail(Error::Code::ReceiveFailed, ep, "read from", ec);
                co_return;
            }

            out = Result<Response>::ok(parse_beast_response(parser.release()));
        }

        net::awaitable<void> exchange(const Endpoint& ep, BeastRequest& req,
                                      const TransportConfiguration& cfg,
                                      net::ssl::context& ssl_ctx,
                                      Outcome& out) {
            auto ex = co_await net::this_coro::executor;
            beast::error_code ec;

            tcp::resolver resolver(ex);
            auto results = co_await resolver.async_resolve(
                ep.host, ep.port, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                out = fail(Error::Code::ConnectionFailed, ep, "resolve", ec);
                co_return;
            }

            if (!ep.https) {
                beast::tcp_stream stream(ex);
                stream.expires_after(cfg.connect_timeout);
                co_await stream.async_connect(
                    results, net::redirect_error(net::use_awaitable, ec));
                if (ec) {
                    out = fail(Error::Code::ConnectionFailed, ep,
                               "connect to", ec);
                    co_return;
                }

                stream.expires_after(cfg.request_timeout);
                co_await write_and_read(stream, ep, req, cfg.max_body_bytes,
                                        out);

                auto r = stream.socket().shutdown(tcp::socket::shutdown_both,
                                                  ec);
                (void)r;
                co_return;
            }

            beast::ssl_stream<beast::tcp_stream> stream(ex, ssl_ctx);
            auto& lowest = beast::get_lowest_layer(stream);

            lowest.expires_after(cfg.connect_timeout);
            co_await lowest.async_connect(
                results, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                out = fail(Error::Code::ConnectionFailed, ep, "connect to", ec);
                co_return;
            }

            if (!set_sni(stream, ep.host, ec)) {
                out = fail(Error::Code::TlsHandshakeFailed, ep, "SNI for", ec);
                co_return;
            }
            if (cfg.verify_tls) {
                stream.set_verify_callback(
                    net::ssl::host_name_verification(ep.host));
            }

            co_await stream.async_handshake(
                net::ssl::stream_base::client,
                net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                out = fail(Error::Code::TlsHandshakeFailed, ep,
                           "TLS handshake with", ec);
                co_return;
            }

            lowest.expires_after(cfg.request_timeout);
            co_await write_and_read(stream, ep, req, cfg.max_body_bytes, out);

            // No TLS shutdown, just close the underlying TCP socket.
            auto r = lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            (void)r;
        }

    }  // namespace

    BeastTransport::BeastTransport(TransportConfiguration config)
        : m_config(std::move(config)),
          m_ssl_ctx(net::ssl::context::tls_client) {
        init_tls_on_ssl_context(m_ssl_ctx, m_config.verify_tls);
    }

    Result<Response> BeastTransport::round_trip(const Context& ctx,
                                                const Request& req) {
        if (auto e = ctx.err()) return Result<Response>::err(std::move(*e));

        auto u_res = parse_url(req.url);
        if (u_res.has_error()) return Result<Response>::err(u_res.error());
        const UrlComponents& u = u_res.value();

        if (to_boost_http_method(req.method) == http::verb::unknown) {
            return Result<Response>::err(Error::Code::Unknown,
                                         "Unknown HTTP method");
        }

        const Endpoint ep = endpoint_from_url(u);
        BeastRequest beast_req =
            prepare_beast_request(req, u, m_config.user_agent);
        Outcome out;

        // Stream and resolver live in the coroutine frame, which is torn
        // down (closing the socket) when ioc is destroyed below.
        net::io_context ioc(1);
        net::co_spawn(ioc, exchange(ep, beast_req, m_config, m_ssl_ctx, out),
                      [&out](std::exception_ptr p) {
                          if (!p) return;
                          try {
                              std::rethrow_exception(p);
                          } catch (const std::exception& e) {
                              out = Result<Response>::err(Error::Code::Unknown,
                                                          e.what());
                          }
                      });

        std::stop_callback stop_io(ctx.stop_token(), [&ioc] { ioc.stop(); });
        if (auto deadline = ctx.deadline()) {
            ioc.run_until(*deadline);
        } else {
            ioc.run();
        }

        if (out) return std::move(*out);
        if (auto e = ctx.err()) return Result<Response>::err(std::move(*e));
        return Result<Response>::err(deadline_exceeded_error());
    }

}  // namespace cluster_cpp

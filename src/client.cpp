#include "cluster_cpp/client.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>

#include "cluster_cpp/logging.hpp"

namespace cluster_cpp {

    namespace {
        constexpr std::string_view kDefaultContentType = "application/json";
    }

    using ClientPtr = std::unique_ptr<ClusterClient>;

    Result<ClientPtr> ClusterClient::create(ClientConfiguration config) {
        auto validated = validate_configuration(std::move(config));
        if (validated.has_error()) return validated.forward_error<ClientPtr>();
        ClientConfiguration cfg = std::move(validated).value();

        std::shared_ptr<Transport> transport = cfg.transport;
        if (!transport) {
            try {
                transport =
                    std::make_shared<BeastTransport>(cfg.transport_config);
            } catch (const std::exception& e) {
                return Result<ClientPtr>::err(
                    Error::Code::InvalidConfiguration,
                    std::string("cannot set up the HTTP transport: ") +
                        e.what());
            }
        }

        auto node_client = std::make_shared<const NodeClient>(
            std::move(transport), NodeClient::interceptors_from(cfg),
            Loggers{cfg.info_log, cfg.trace_log, cfg.error_log},
            cfg.transport_config.user_agent);

        auto pool = ConnectionPool::create(cfg.urls, cfg.error_log);
        if (pool.has_error()) return pool.forward_error<ClientPtr>();

        auto client = std::make_unique<ClusterClient>(
            CreateTag{}, std::move(cfg), std::move(pool).value(),
            std::move(node_client));
        const ClientConfiguration& c = client->m_config;
        const Context ctx = Context::background();

        if (c.sniffer_enabled) {
            auto st = client->m_sniffer.sniff_startup(
                ctx, c.sniffer_timeout_startup);
            if (st.has_error()) return st.forward_error<ClientPtr>();
        }

        if (c.healthcheck_enabled) {
            auto st = client->m_health.wait_for_healthy(
                ctx, c.healthcheck_timeout_startup);
            if (st.has_error()) return st.forward_error<ClientPtr>();
            client->m_health.check_all(ctx, c.healthcheck_timeout);
        }

        client->start();
        return Result<ClientPtr>::ok(std::move(client));
    }

    ClusterClient::ClusterClient(CreateTag, ClientConfiguration config,
                                 std::shared_ptr<ConnectionPool> pool,
                                 std::shared_ptr<const NodeClient> client)
        : m_config(std::move(config)),
          m_pool(std::move(pool)),
          m_client(std::move(client)),
          m_sniffer(m_pool, m_client, SnifferOptions::from(m_config)),
          m_health(m_pool, m_client, HealthCheckOptions::from(m_config)) {}

    ClusterClient::~ClusterClient() { stop(); }

    Result<Response> ClusterClient::perform_request(
        const PerformRequestOptions& opts) {
        return perform_request(Context::background(), opts);
    }

    Result<Response> ClusterClient::perform_request(
        const Context& ctx, const PerformRequestOptions& opts) {
        auto encoded = encode_body(opts.body);
        if (encoded.has_error()) return encoded.forward_error<Response>();
        const std::optional<std::string> body = std::move(encoded).value();

        HttpMethod method = opts.method;
        if (method == HttpMethod::Get && body) {
            method = m_config.send_get_body_as;
        }

        auto headers = opts.headers;
        if (body) {
            headers.emplace("Content-Type",
                            opts.content_type.empty()
                                ? std::string(kDefaultContentType)
                                : opts.content_type);
        }

        const Loggers& log = m_client->loggers();
        // Wide enough that max_retries == INT_MAX does not overflow.
        const std::int64_t max_attempts =
            std::int64_t{1} + m_config.max_retries;
        std::int64_t attempts = 0;
        std::optional<Error> last_failure;

        while (true) {
            if (auto e = ctx.err()) return Result<Response>::err(std::move(*e));

            auto selected = m_pool->select();
            // Nothing tried yet: report the exhausted pool. After a failure
            // the pool has just been resurrected, so pick again.
            if (selected.has_error() && last_failure &&
                selected.code() == Error::Code::PoolExhausted) {
                selected = m_pool->select();
                if (selected.has_error()) {
                    return Result<Response>::err(std::move(*last_failure));
                }
            }
            if (selected.has_error()) return selected.forward_error<Response>();
            const auto conn = std::move(selected).value();

            const std::string url =
                build_request_url(conn->url(), opts.path, opts.params);
            const auto started = std::chrono::steady_clock::now();
            auto res =
                m_client->send(ctx, Request{method, url, headers, body});
            const auto took = std::chrono::steady_clock::now() - started;

            if (res.has_error()) {
                Error err = std::move(res).error();

                // The caller gave up: not the node's fault.
                if (auto e = ctx.err()) {
                    return Result<Response>::err(std::move(*e));
                }
                if (is_context_error(err.code) ||
                    !is_transport_failure(err.code)) {
                    return Result<Response>::err(std::move(err));
                }

                m_pool->mark_dead(conn);
                logging::error(log.error, "{} is dead: {}", conn->url(),
                               err.message);

                if (++attempts >= max_attempts) {
                    return Result<Response>::err(std::move(err));
                }
                last_failure = std::move(err);
                if (m_config.backoff) {
                    const auto delay = m_config.backoff->next(
                        static_cast<std::size_t>(attempts));
                    if (delay.count() > 0 && !ctx.sleep_for(delay)) {
                        auto e = ctx.err();
                        return Result<Response>::err(
                            e ? std::move(*e) : deadline_exceeded_error());
                    }
                }
                continue;
            }

            Response& r = res.value();
            logging::info(log.info, "{}",
                          logging::request_line(method, url, r.status_code,
                                                took));
            // It answered, whatever the status.
            m_pool->mark_alive(conn);

            if (!r.is_success() && !is_ignored(opts, r.status_code)) {
                Error err{Error::Code::HttpStatus,
                          std::string(to_string(method)) + " " + url +
                              " failed with status " +
                              std::to_string(r.status_code)};
                err.response = std::make_shared<const Response>(std::move(r));
                return Result<Response>::err(std::move(err));
            }
            return res;
        }
    }

    bool ClusterClient::is_ignored(const PerformRequestOptions& opts,
                                   int status) const {
        return std::find(opts.ignore_statuses.begin(),
                         opts.ignore_statuses.end(),
                         status) != opts.ignore_statuses.end();
    }

    void ClusterClient::start() {
        std::lock_guard<std::mutex> lk(m_lifecycle_mutex);
        if (m_running) return;

        if (m_config.sniffer_enabled) {
            m_sniffer_task = std::make_unique<PeriodicTask>(
                [this](std::stop_token st) { m_sniffer.run(std::move(st)); });
        }
        if (m_config.healthcheck_enabled) {
            m_health_task = std::make_unique<PeriodicTask>(
                [this](std::stop_token st) { m_health.run(std::move(st)); });
        }
        m_running = true;
    }

    void ClusterClient::stop() {
        std::lock_guard<std::mutex> lk(m_lifecycle_mutex);
        if (!m_running) return;

        // Destroying a task requests stop and joins it.
        m_sniffer_task.reset();
        m_health_task.reset();
        m_running = false;
    }

    bool ClusterClient::is_running() const {
        std::lock_guard<std::mutex> lk(m_lifecycle_mutex);
        return m_running;
    }

    std::vector<std::shared_ptr<Connection>> ClusterClient::connections()
        const {
        return m_pool->snapshot();
    }

}  // namespace cluster_cpp

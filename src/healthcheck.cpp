#include "cluster_cpp/healthcheck.hpp"

#include <algorithm>

#include "cluster_cpp/periodic_task.hpp"
#include "cluster_cpp/url.hpp"

namespace cluster_cpp {

    namespace {
        constexpr std::chrono::milliseconds kMaxStartupPause{1000};
    }

    HealthCheckOptions HealthCheckOptions::from(const ClientConfiguration& cfg) {
        HealthCheckOptions o;
        o.path = cfg.healthcheck_path;
        o.timeout = cfg.healthcheck_timeout;
        o.interval = cfg.healthcheck_interval;
        return o;
    }

    HealthChecker::HealthChecker(std::shared_ptr<ConnectionPool> pool,
                                 std::shared_ptr<const NodeClient> client,
                                 HealthCheckOptions opts)
        : m_pool(std::move(pool)),
          m_client(std::move(client)),
          m_opts(std::move(opts)) {}

    bool HealthChecker::check(const Context& ctx,
                              const std::shared_ptr<Connection>& conn) const {
        Request req{HttpMethod::Head,
                    build_request_url(conn->url(), m_opts.path), {},
                    std::nullopt};
        auto res = m_client->send(ctx, std::move(req));
        return res.has_value() && res.value().is_success();
    }

    void HealthChecker::check_all(const Context& ctx,
                                  std::chrono::milliseconds per_probe) const {
        for (const auto& conn : m_pool->snapshot()) {
            if (ctx.done()) return;

            const bool alive = check(ctx.with_timeout(per_probe), conn);
            // The caller gave up; that says nothing about the node.
            if (ctx.done()) return;

            if (alive) {
                m_pool->mark_alive(conn);
            } else {
                if (!conn->is_dead()) {
                    logging::error(m_client->loggers().error,
                                   "{} failed its health check", conn->url());
                }
                m_pool->mark_dead(conn);
            }
        }
    }

    Status HealthChecker::wait_for_healthy(
        const Context& ctx, std::chrono::milliseconds timeout) const {
        const Context gate = ctx.with_timeout(timeout);
        while (!gate.done()) {
            for (const auto& conn : m_pool->snapshot()) {
                if (gate.done()) break;
                if (check(gate.with_timeout(m_opts.timeout), conn)) {
                    m_pool->mark_alive(conn);
                    return Status::ok();
                }
            }
            const auto pause = std::min<Context::clock::duration>(
                kMaxStartupPause, gate.remaining_or(kMaxStartupPause));
            if (!gate.sleep_for(pause)) break;
        }

        if (ctx.canceled()) return Status::err(canceled_error());
        return Status::err(Error::Code::NoUsableNode,
                           "no node answered the health check within " +
                               std::to_string(timeout.count()) + "ms");
    }

    void HealthChecker::run(std::stop_token stop) const {
        run_periodically(std::move(stop), m_opts.interval,
                         [this](const Context& ctx) {
                             check_all(ctx, m_opts.timeout);
                         });
    }

}  // namespace cluster_cpp

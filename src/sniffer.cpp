#include "cluster_cpp/sniffer.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

#include "cluster_cpp/periodic_task.hpp"
#include "cluster_cpp/url.hpp"

namespace cluster_cpp {

    namespace {

        using json = nlohmann::json;
        using UrlList = std::vector<std::string>;
        using Members = std::vector<std::shared_ptr<Connection>>;

        constexpr std::chrono::milliseconds kStartupRetryPause{250};

        bool contains(const UrlList& list, const std::string& url) {
            return std::find(list.begin(), list.end(), url) != list.end();
        }

        bool is_port(std::string_view s) {
            return !s.empty() &&
                   std::all_of(s.begin(), s.end(), [](unsigned char c) {
                       return std::isdigit(c);
                   });
        }

    }  // namespace

    SnifferOptions SnifferOptions::from(const ClientConfiguration& cfg) {
        SnifferOptions o;
        o.seeds = cfg.urls;
        o.scheme = cfg.scheme;
        o.path = cfg.sniffer_path;
        o.timeout = cfg.sniffer_timeout;
        o.interval = cfg.sniffer_interval;
        return o;
    }

    std::optional<std::string> parse_publish_address(std::string_view a) {
        if (a.rfind("inet[", 0) == 0 && a.size() > 5 && a.back() == ']') {
            a = a.substr(5, a.size() - 6);
        }
        // hostname/ip:port
        if (auto slash = a.find('/'); slash != std::string_view::npos) {
            a = a.substr(slash + 1);
        }
        if (a.empty()) return std::nullopt;

        std::string_view host;
        std::string_view port;
        if (a.front() == '[') {
            auto close = a.find(']');
            if (close == std::string_view::npos) return std::nullopt;
            host = a.substr(0, close + 1);
            auto rest = a.substr(close + 1);
            if (rest.size() < 2 || rest.front() != ':') return std::nullopt;
            port = rest.substr(1);
        } else {
            auto colon = a.rfind(':');
            if (colon == std::string_view::npos || colon == 0) {
                return std::nullopt;
            }
            host = a.substr(0, colon);
            port = a.substr(colon + 1);
            // A bare IPv6 literal cannot be told apart from its port.
            if (host.find(':') != std::string_view::npos) return std::nullopt;
        }

        if (!is_port(port)) return std::nullopt;
        return std::string(host) + ":" + std::string(port);
    }

    Result<UrlList> parse_nodes_response(std::string_view body,
                                         std::string_view scheme) {
        auto doc = json::parse(body.begin(), body.end(), nullptr,
                               /*allow_exceptions=*/false);
        if (doc.is_discarded()) {
            return Result<UrlList>::err(Error::Code::InvalidResponse,
                                        "member list is not valid JSON");
        }

        auto nodes = doc.find("nodes");
        if (nodes == doc.end() || !nodes->is_object()) {
            return Result<UrlList>::err(Error::Code::InvalidResponse,
                                        "member list has no 'nodes' object");
        }

        UrlList out;
        for (const auto& item : nodes->items()) {
            const json& node = item.value();
            if (!node.is_object()) continue;

            auto http = node.find("http");
            if (http == node.end() || !http->is_object()) continue;

            auto published = http->find("publish_address");
            if (published == http->end() || !published->is_string()) continue;

            auto addr = parse_publish_address(
                published->get_ref<const std::string&>());
            if (!addr) continue;

            auto url =
                canonicalize_url(std::string(scheme) + "://" + *addr);
            if (url.has_error()) continue;
            if (!contains(out, url.value())) out.push_back(url.value());
        }

        if (out.empty()) {
            return Result<UrlList>::err(Error::Code::InvalidResponse,
                                        "member list is empty");
        }
        return Result<UrlList>::ok(std::move(out));
    }

    Sniffer::Sniffer(std::shared_ptr<ConnectionPool> pool,
                     std::shared_ptr<const NodeClient> client,
                     SnifferOptions opts)
        : m_pool(std::move(pool)),
          m_client(std::move(client)),
          m_opts(std::move(opts)) {}

    Result<Members> Sniffer::sniff_node(const Context& ctx,
                                        const std::string& url) const {
        using Out = Result<Members>;

        Request req{HttpMethod::Get, build_request_url(url, m_opts.path), {},
                    std::nullopt};
        auto res = m_client->send(ctx, std::move(req));
        if (res.has_error()) return res.forward_error<Members>();

        const Response& r = res.value();
        if (!r.is_success()) {
            Error e{Error::Code::HttpStatus,
                    url + " answered discovery with status " +
                        std::to_string(r.status_code)};
            e.response = std::make_shared<const Response>(r);
            return Out::err(std::move(e));
        }

        auto urls = parse_nodes_response(r.body, m_opts.scheme);
        if (urls.has_error()) {
            return Out::err(Error::Code::InvalidResponse,
                            url + ": " + urls.error().message);
        }

        Members out;
        out.reserve(urls.value().size());
        for (auto& u : urls.value()) {
            out.push_back(std::make_shared<Connection>(std::move(u)));
        }
        return Out::ok(std::move(out));
    }

    UrlList Sniffer::candidate_urls() const {
        UrlList out = m_opts.seeds;
        for (const auto& conn : m_pool->snapshot()) {
            if (!conn->is_dead() && !contains(out, conn->url())) {
                out.push_back(conn->url());
            }
        }
        return out;
    }

    Status Sniffer::sniff(const Context& ctx) const {
        if (auto e = ctx.err()) return Status::err(std::move(*e));

        const UrlList candidates = candidate_urls();
        const Context pass = ctx.with_cancel();

        std::mutex mu;
        std::optional<UrlList> members;
        std::optional<Error> last_error;
        {
            std::vector<std::jthread> workers;
            workers.reserve(candidates.size());
            for (const auto& url : candidates) {
                workers.emplace_back([&, url] {
                    auto res = sniff_node(pass, url);
                    std::lock_guard<std::mutex> lk(mu);
                    if (members) return;
                    if (res.has_error()) {
                        last_error = res.error();
                        return;
                    }
                    members.emplace();
                    for (const auto& c : res.value()) {
                        members->push_back(c->url());
                    }
                    // First answer wins; abort the others.
                    pass.cancel();
                });
            }
        }

        if (!members) {
            if (auto e = ctx.err()) return Status::err(std::move(*e));
            std::string msg = "no node answered discovery";
            if (last_error) msg += ": " + last_error->message;
            return Status::err(Error::Code::NoUsableNode, std::move(msg));
        }

        const UrlList before = m_pool->urls();
        auto replaced = m_pool->replace(*members);
        if (replaced.has_error()) return replaced;
        report_membership_change(before, *members);
        return Status::ok();
    }

    Status Sniffer::sniff_startup(const Context& ctx,
                                  std::chrono::milliseconds timeout) const {
        const Context startup = ctx.with_timeout(timeout);
        std::string last = "no attempt made";
        while (true) {
            auto st = sniff(startup);
            if (st.has_value()) return st;
            last = st.error().message;
            if (!startup.sleep_for(kStartupRetryPause)) break;
        }

        if (ctx.canceled()) return Status::err(canceled_error());
        return Status::err(Error::Code::NoUsableNode,
                           "no node answered discovery within " +
                               std::to_string(timeout.count()) + "ms: " + last);
    }

    void Sniffer::run(std::stop_token stop) const {
        run_periodically(std::move(stop), m_opts.interval,
                         [this](const Context& ctx) {
                             auto st = sniff(ctx.with_timeout(m_opts.timeout));
                             if (st.has_error() && !ctx.canceled()) {
                                 logging::error(m_client->loggers().error,
                                                "discovery failed: {}",
                                                st.error().message);
                             }
                         });
    }

    void Sniffer::report_membership_change(const UrlList& before,
                                           const UrlList& after) const {
        const auto& log = m_client->loggers().info;
        if (!log) return;
        for (const auto& u : after) {
            if (!contains(before, u)) {
                logging::info(log, "{} joined the cluster", u);
            }
        }
        for (const auto& u : before) {
            if (!contains(after, u)) {
                logging::info(log, "{} left the cluster", u);
            }
        }
    }

}  // namespace cluster_cpp

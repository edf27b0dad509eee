#include "cluster_cpp/config.hpp"

#include <algorithm>

#include "cluster_cpp/url.hpp"

namespace cluster_cpp {

    namespace {

        using CfgResult = Result<ClientConfiguration>;

        CfgResult invalid(std::string msg) {
            return CfgResult::err(Error::Code::InvalidConfiguration,
                                  std::move(msg));
        }

        std::string with_leading_slash(std::string path) {
            if (path.empty() || path.front() != '/') path.insert(0, "/");
            return path;
        }

    }  // namespace

    CfgResult validate_configuration(ClientConfiguration cfg) {
        using std::chrono::milliseconds;

        if (cfg.urls.empty()) cfg.urls.emplace_back(kDefaultUrl);

        std::vector<std::string> canonical;
        canonical.reserve(cfg.urls.size());
        for (const auto& raw : cfg.urls) {
            auto c = canonicalize_url(raw);
            if (c.has_error()) return c.forward_error<ClientConfiguration>();
            if (std::find(canonical.begin(), canonical.end(), c.value()) ==
                canonical.end()) {
                canonical.push_back(std::move(c).value());
            }
        }
        cfg.urls = std::move(canonical);

        const std::pair<const char*, milliseconds> durations[] = {
            {"sniffer_timeout_startup", cfg.sniffer_timeout_startup},
            {"sniffer_timeout", cfg.sniffer_timeout},
            {"sniffer_interval", cfg.sniffer_interval},
            {"healthcheck_timeout_startup", cfg.healthcheck_timeout_startup},
            {"healthcheck_timeout", cfg.healthcheck_timeout},
            {"healthcheck_interval", cfg.healthcheck_interval},
            {"transport_config.connect_timeout",
             cfg.transport_config.connect_timeout},
            {"transport_config.request_timeout",
             cfg.transport_config.request_timeout},
        };
        for (const auto& [name, value] : durations) {
            if (value <= milliseconds::zero()) {
                return invalid(std::string(name) + " must be positive");
            }
        }

        if (cfg.max_retries < 0) {
            return invalid("max_retries must not be negative");
        }

        cfg.scheme = url_utils::to_lower(std::move(cfg.scheme));
        if (cfg.scheme != "http" && cfg.scheme != "https") {
            return invalid("scheme must be http or https, got '" + cfg.scheme +
                           "'");
        }

        cfg.sniffer_path = with_leading_slash(std::move(cfg.sniffer_path));
        cfg.healthcheck_path =
            with_leading_slash(std::move(cfg.healthcheck_path));

        return CfgResult::ok(std::move(cfg));
    }

}  // namespace cluster_cpp

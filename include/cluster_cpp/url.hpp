#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <string_view>

#include "result.hpp"

namespace cluster_cpp {

    struct UrlComponents {
        bool https{false};
        std::string host;  // without IPv6 brackets
        std::string port;
        // Full request target (path + optional query), always starts with '/'.
        std::string target;
    };

    /// @brief Query parameters, encoded in key order.
    using QueryParams = std::map<std::string, std::string>;

    inline constexpr std::string_view kDefaultScheme = "http";

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        /// @param s The URL string to check.
        /// @return True if the URL starts with "http://" or "https://".
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        /// @brief Trim trailing slashes from a string.
        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        inline std::string to_lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        }

        /// @brief Percent-encode everything except RFC 3986 unreserved
        /// characters.
        inline std::string url_encode(std::string_view s) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s) {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
                    c == '~') {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(kHex[c >> 4]);
                    out.push_back(kHex[c & 0x0F]);
                }
            }
            return out;
        }

        /// @brief Encode query parameters as `k1=v1&k2=v2` (no leading '?').
        inline std::string encode_query(const QueryParams& params) {
            std::string out;
            for (const auto& [k, v] : params) {
                if (!out.empty()) out.push_back('&');
                out += url_encode(k);
                out.push_back('=');
                out += url_encode(v);
            }
            return out;
        }

        inline std::string_view default_port(bool https) {
            return https ? "443" : "80";
        }

        /// @brief host[:port] as it goes into a URL or a Host header.
        /// The port is left out when it is the scheme default.
        inline std::string authority(const UrlComponents& u) {
            std::string out;
            if (u.host.find(':') != std::string::npos) {
                out = "[" + u.host + "]";
            } else {
                out = u.host;
            }
            if (!u.port.empty() && u.port != default_port(u.https)) {
                out += ":" + u.port;
            }
            return out;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute URL into its components.
    /// @param url The URL string to parse.
    /// @return A Result containing the UrlComponents on success, or an Error on
    /// failure.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            https = false;
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from path
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto slash = s.find_first_of("/?#"); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        if (hostport.front() == '[') {
            // IPv6 literal: [addr]:port
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = std::string(hostport.substr(1, close - 1));
            std::string_view rest = hostport.substr(close + 1);
            if (rest.empty()) {
                port = url_utils::default_port(https);
            } else if (rest.front() == ':' && rest.size() > 1) {
                port = std::string(rest.substr(1));
            } else {
                return make_err("URL has malformed port");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
        } else {
            host = std::string(hostport);
            port = url_utils::default_port(https);
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }
        if (!std::all_of(port.begin(), port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return make_err("URL has non-numeric port");
        }

        UrlComponents out;
        out.https = https;
        out.host = url_utils::to_lower(std::move(host));
        out.port = std::move(port);
        if (path.front() != '/') {
            out.target = "/" + std::string(path);
        } else {
            out.target = std::string(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

    /// @brief Bring a node URL into the canonical form used as identity key:
    /// lower-case scheme and host, default scheme "http" when missing, no
    /// query, no fragment, no trailing slash, scheme-default port omitted.
    inline Result<std::string> canonicalize_url(std::string_view raw) {
        std::string s(raw);
        if (s.find("://") == std::string::npos) {
            s = std::string(kDefaultScheme) + "://" + s;
        } else {
            auto sep = s.find("://");
            s = url_utils::to_lower(s.substr(0, sep)) + s.substr(sep);
        }

        auto parsed = parse_url(s);
        if (parsed.has_error()) {
            return Result<std::string>::err(
                Error::Code::InvalidUrl,
                "Invalid node URL '" + std::string(raw) +
                    "': " + parsed.error().message);
        }

        const UrlComponents& u = parsed.value();
        std::string path = u.target;
        if (auto q = path.find_first_of("?#"); q != std::string::npos) {
            path.erase(q);
        }
        path = url_utils::trim_trailing_slashes(std::move(path));

        std::string out = u.https ? "https://" : "http://";
        out += url_utils::authority(u);
        out += path;
        return Result<std::string>::ok(std::move(out));
    }

    /// @brief Append `path` and the encoded query to a canonical node URL.
    inline std::string build_request_url(std::string_view node_url,
                                         std::string_view path,
                                         const QueryParams& params = {}) {
        std::string out(node_url);
        if (path.empty() || path.front() != '/') out.push_back('/');
        out.append(path);
        if (!params.empty()) {
            out.push_back('?');
            out += url_utils::encode_query(params);
        }
        return out;
    }

}  // namespace cluster_cpp

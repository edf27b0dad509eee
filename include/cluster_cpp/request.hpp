#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

#include "http_method.hpp"
#include "result.hpp"
#include "url.hpp"

namespace cluster_cpp {

    /// @brief A single HTTP exchange with one node.
    struct Request {
        HttpMethod method;
        std::string url;  // absolute
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;
    };

    /// @brief Body of a request issued through the cluster client.
    /// - std::monostate: no body
    /// - std::string: sent verbatim
    /// - nlohmann::json: serialized with dump()
    using RequestBody = std::variant<std::monostate, std::string, nlohmann::json>;

    /// @brief Serialize a request body into its wire payload.
    /// @return nullopt for an empty body, EncodingFailed if the JSON value
    /// cannot be serialized (e.g. invalid UTF-8 in a string).
    inline Result<std::optional<std::string>> encode_body(
        const RequestBody& body) {
        using Out = Result<std::optional<std::string>>;
        if (std::holds_alternative<std::monostate>(body)) {
            return Out::ok(std::nullopt);
        }
        if (const auto* s = std::get_if<std::string>(&body)) {
            return Out::ok(*s);
        }
        try {
            return Out::ok(std::get<nlohmann::json>(body).dump());
        } catch (const nlohmann::json::exception& e) {
            return Out::err(Error::Code::EncodingFailed,
                            std::string("Failed to encode body: ") + e.what());
        }
    }

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const UrlComponents& url,
                          const std::string& user_agent,
                          const bool keep_alive = false) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(url.target);
        beast_req.set(http::field::host, url_utils::authority(url));
        beast_req.set(http::field::user_agent, user_agent);
        beast_req.keep_alive(keep_alive);
        apply_request_headers(req.headers, beast_req.base());
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

}  // namespace cluster_cpp

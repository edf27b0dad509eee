#pragma once

#include <fmt/format.h>
#include <spdlog/logger.h>

#include <boost/beast/http/write.hpp>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "http_method.hpp"
#include "request.hpp"
#include "response.hpp"
#include "url.hpp"

namespace cluster_cpp {

    /// @brief A log channel. A null pointer disables the channel.
    using LoggerPtr = std::shared_ptr<spdlog::logger>;

    /// @brief The three channels a client reports to.
    struct Loggers {
        LoggerPtr info;   ///< one line per request
        LoggerPtr trace;  ///< full request and response dumps
        LoggerPtr error;  ///< dead nodes, resurrection, failed background work
    };

    namespace logging {

        template <typename... Args>
        inline void info(const LoggerPtr& logger,
                         fmt::format_string<Args...> fmt, Args&&... args) {
            if (logger) logger->info(fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        inline void trace(const LoggerPtr& logger,
                          fmt::format_string<Args...> fmt, Args&&... args) {
            if (logger) logger->trace(fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        inline void error(const LoggerPtr& logger,
                          fmt::format_string<Args...> fmt, Args&&... args) {
            if (logger) logger->error(fmt, std::forward<Args>(args)...);
        }

        /// @brief `GET http://host:9200/_search [status:200, request:0.012s]`
        inline std::string request_line(HttpMethod method,
                                        const std::string& url, int status,
                                        std::chrono::nanoseconds took) {
            const double secs =
                std::chrono::duration_cast<std::chrono::duration<double>>(
                    took)
                    .count();
            return fmt::format("{} {} [status:{}, request:{:.3f}s]",
                               to_string(method), url, status, secs);
        }

        /// @brief The request as it goes on the wire.
        inline std::string dump_request(const Request& req,
                                        const std::string& user_agent) {
            auto u = parse_url(req.url);
            if (u.has_error()) {
                return std::string(to_string(req.method)) + " " + req.url;
            }
            std::ostringstream os;
            os << prepare_beast_request(req, u.value(), user_agent);
            return os.str();
        }

        /// @brief The response as it came off the wire.
        inline std::string dump_response(const Response& res) {
            namespace http = boost::beast::http;
            http::response<http::string_body> out;
            out.version(11);
            out.result(static_cast<unsigned>(res.status_code));
            for (const auto& [k, v] : res.headers) out.set(k, v);
            out.body() = res.body;
            std::ostringstream os;
            os << out;
            return os.str();
        }

    }  // namespace logging

}  // namespace cluster_cpp

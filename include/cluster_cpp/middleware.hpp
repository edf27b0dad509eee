#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "request.hpp"
#include "url.hpp"

namespace cluster_cpp {

    /**
     * @brief Interface for modifying requests before they are sent to a node.
     *
     * Interceptors run for every exchange the client makes: regular requests,
     * discovery calls and health probes.
     */
    class RequestInterceptor {
       public:
        virtual ~RequestInterceptor() = default;

        /**
         * @brief Performs modifications on the outgoing request.
         * @param req The request object to modify.
         * @param url The resolved URL components for the request.
         */
        virtual void prepare(Request& req, const UrlComponents& url) const = 0;
    };

    /// @brief Standard base64 (with padding) of a byte string.
    inline std::string base64_encode(std::string_view in) {
        std::string out(4 * ((in.size() + 2) / 3), '\0');
        const int n = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(out.data()),
            reinterpret_cast<const unsigned char*>(in.data()),
            static_cast<int>(in.size()));
        out.resize(static_cast<std::size_t>(n));
        return out;
    }

    /**
     * @brief Interceptor for HTTP Basic authentication.
     *
     * Adds an `Authorization: Basic <base64(user:password)>` header.
     */
    class BasicAuthInterceptor : public RequestInterceptor {
       public:
        BasicAuthInterceptor(std::string username, std::string password)
            : header_("Basic " + base64_encode(username + ":" + password)) {}

        void prepare(Request& req,
                     const UrlComponents& /*url*/) const override {
            req.headers["Authorization"] = header_;
        }

       private:
        std::string header_;
    };

    /**
     * @brief Interceptor adding a fixed set of headers.
     *
     * Headers already present on the request are left alone, so per-request
     * headers win over defaults.
     */
    class DefaultHeadersInterceptor : public RequestInterceptor {
       public:
        explicit DefaultHeadersInterceptor(
            std::unordered_map<std::string, std::string> headers)
            : headers_(std::move(headers)) {}

        void prepare(Request& req,
                     const UrlComponents& /*url*/) const override {
            for (const auto& [k, v] : headers_) {
                req.headers.emplace(k, v);
            }
        }

       private:
        std::unordered_map<std::string, std::string> headers_;
    };

    using InterceptorList = std::vector<std::shared_ptr<const RequestInterceptor>>;

    inline void apply_interceptors(const InterceptorList& interceptors,
                                   Request& req, const UrlComponents& url) {
        for (const auto& i : interceptors) {
            if (i) i->prepare(req, url);
        }
    }

}  // namespace cluster_cpp

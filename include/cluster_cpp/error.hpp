#pragma once
#include <memory>
#include <string>

#include "response.hpp"

namespace cluster_cpp {
    /**
     * @brief Represents an error that occurred while talking to the cluster.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,        /**< The provided URL is malformed or invalid. */
            InvalidConfiguration, /**< A configuration value was rejected. */
            ConnectionFailed,  /**< Failed to resolve or connect to a node. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            Timeout,           /**< A socket operation timed out. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            NetworkError,      /**< General network error. */
            Canceled,          /**< The caller canceled the context. */
            DeadlineExceeded,  /**< The context deadline elapsed. */
            NoUsableNode,      /**< No node of the cluster could be reached. */
            PoolExhausted,     /**< Every pooled node was dead. */
            HttpStatus,        /**< A node answered with a non-2xx status. */
            EncodingFailed,    /**< The request body could not be encoded. */
            InvalidResponse,   /**< A node answered with an unusable body. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /**
         * @brief The response that caused the error, if a node answered.
         * @note Only set for Code::HttpStatus.
         */
        std::shared_ptr<const Response> response{};
    };

    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::Canceled:
                return "Canceled";
            case Error::Code::DeadlineExceeded:
                return "DeadlineExceeded";
            case Error::Code::NoUsableNode:
                return "NoUsableNode";
            case Error::Code::PoolExhausted:
                return "PoolExhausted";
            case Error::Code::HttpStatus:
                return "HttpStatus";
            case Error::Code::EncodingFailed:
                return "EncodingFailed";
            case Error::Code::InvalidResponse:
                return "InvalidResponse";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief True for failures below the HTTP layer: no response was
    /// obtained from the node, so another node may be tried.
    inline constexpr bool is_transport_failure(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::ConnectionFailed:
            case Error::Code::TlsHandshakeFailed:
            case Error::Code::Timeout:
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
            case Error::Code::NetworkError:
                return true;
            default:
                return false;
        }
    }

    /// @brief True for errors that come from the caller's context rather
    /// than from the node.
    inline constexpr bool is_context_error(Error::Code code) noexcept {
        return code == Error::Code::Canceled ||
               code == Error::Code::DeadlineExceeded;
    }
}  // namespace cluster_cpp

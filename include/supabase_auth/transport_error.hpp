#pragma once
#include <boost/system/error_code.hpp>
#include <string>

namespace supabase_auth {
    /**
     * @brief Represents a failure of the HTTP transport layer.
     */
    struct TransportError {
        /** @brief Enumeration of transport failure kinds. */
        enum class Code {
            InvalidUrl,        /**< The provided URL is malformed or invalid. */
            ConnectionFailed,  /**< Failed to resolve or connect to the host. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            Timeout,           /**< The operation timed out. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            NetworkError,      /**< General network error. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The failure kind. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief The underlying Asio/Beast/OpenSSL error, if any. */
        boost::system::error_code ec{};

        friend bool operator==(const TransportError& a,
                               const TransportError& b) noexcept {
            return a.code == b.code && a.message == b.message && a.ec == b.ec;
        }
    };
}  // namespace supabase_auth

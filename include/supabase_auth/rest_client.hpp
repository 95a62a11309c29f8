#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <optional>
#include <string>

#include "config.hpp"
#include "endpoint.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "transport_error.hpp"
#include "url.hpp"

namespace supabase_auth {

    using TransportResult = Result<Response, TransportError>;

    /**
     * @brief A synchronous HTTP/HTTPS client.
     *
     * Keeps one connection open and reuses it while requests go to the same
     * endpoint. Connect, TLS handshake, write and read are bounded by the
     * configured timeouts. Not thread-safe; each thread should use its own
     * instance.
     */
    class RestClient {
       public:
        /**
         * @brief Constructs a RestClient with the given configuration.
         * @throws std::invalid_argument if config.base_url is set but invalid.
         */
        explicit RestClient(RestClientConfiguration config);
        ~RestClient() noexcept;

        RestClient(const RestClient&) = delete;
        RestClient& operator=(const RestClient&) = delete;

        RestClient(RestClient&&) = delete;
        RestClient& operator=(RestClient&&) = delete;

        [[nodiscard]] const RestClientConfiguration& config() const noexcept;

        /**
         * @brief Sends a request.
         * @param request Method, absolute or base-relative URL, headers, body.
         * @return The Response (any status code) or a TransportError.
         */
        [[nodiscard]] TransportResult send(const Request& request);

        [[nodiscard]] TransportResult get(const std::string& url);
        [[nodiscard]] TransportResult del(const std::string& url);
        [[nodiscard]] TransportResult post(const std::string& url,
                                           std::string body);
        [[nodiscard]] TransportResult put(const std::string& url,
                                          std::string body);
        [[nodiscard]] TransportResult patch(const std::string& url,
                                            std::string body);

       private:
        using tcp = boost::asio::ip::tcp;

        template <typename Initiate>
        boost::system::error_code run_with_timeout(
            boost::beast::tcp_stream& stream, std::chrono::milliseconds timeout,
            Initiate&& initiate);

        template <typename Stream>
        TransportResult exchange(Stream& stream, http_request& req);

        /// @brief Reuse the open connection if it points at `u`, otherwise
        /// close it and connect (and handshake, for https) anew.
        boost::system::error_code resolve(const UrlComponents& u,
                                          tcp::resolver::results_type& out);
        std::optional<TransportError> ensure_connected(const UrlComponents& u);

        void close_http();
        void close_https();
        void close();

        RestClientConfiguration m_config{};
        std::optional<UrlComponents> m_base_url;

        boost::asio::io_context io_{1};
        tcp::resolver m_resolver{io_};
        boost::asio::ssl::context m_ssl_context{
            boost::asio::ssl::context::tls_client};

        boost::beast::flat_buffer m_buffer;
        std::optional<boost::beast::tcp_stream> m_http_stream;
        std::optional<boost::beast::ssl_stream<boost::beast::tcp_stream>>
            m_https_stream;
        Endpoint m_connection;
    };

}  // namespace supabase_auth

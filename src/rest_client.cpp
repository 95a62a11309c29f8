#include "supabase_auth/rest_client.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

namespace supabase_auth {

    namespace {
        TransportError make_error(const boost::system::error_code& ec,
                                  TransportError::Code code,
                                  std::string_view what) {
            if (ec == beast::error::timeout) {
                code = TransportError::Code::Timeout;
            }
            return TransportError{code, std::string(what) + ec.message(), ec};
        }
    }  // namespace

    RestClient::RestClient(RestClientConfiguration config)
        : m_config(std::move(config)) {
        init_tls_on_ssl_context(m_ssl_context, m_config.verify_tls);
        if (m_config.base_url) {
            auto base_res = parse_base_url(*m_config.base_url);
            if (base_res.has_error()) {
                throw std::invalid_argument("Invalid base_url: " +
                                            base_res.error().message);
            }
            m_base_url = std::move(base_res).value();
        }
    }

    RestClient::~RestClient() noexcept { close(); }

    const RestClientConfiguration& RestClient::config() const noexcept {
        return m_config;
    }

    TransportResult RestClient::send(const Request& request) {
        const UrlComponents* base = m_base_url ? &*m_base_url : nullptr;

        auto u_res = resolve_url(request.url, base);
        if (u_res.has_error()) {
            return TransportResult::err(std::move(u_res).error());
        }
        UrlComponents url = std::move(u_res).value();

        if (to_beast_verb(request.method) == http::verb::unknown) {
            return TransportResult::err(TransportError{
                TransportError::Code::Unknown, "Unknown HTTP method"});
        }

        http_request req = prepare_beast_request(
            request, url, m_config.user_agent, m_config.default_headers);

        if (auto failure = ensure_connected(url)) {
            return TransportResult::err(std::move(*failure));
        }

        if (url.https) {
            return exchange(*m_https_stream, req);
        }
        return exchange(*m_http_stream, req);
    }

    // Convenience methods
    TransportResult RestClient::get(const std::string& url) {
        return send(Request{HttpMethod::Get, url, {}, std::nullopt});
    }

    TransportResult RestClient::del(const std::string& url) {
        return send(Request{HttpMethod::Delete, url, {}, std::nullopt});
    }

    TransportResult RestClient::post(const std::string& url,
                                     std::string body) {
        return send(Request{HttpMethod::Post, url, {}, std::move(body)});
    }

    TransportResult RestClient::put(const std::string& url, std::string body) {
        return send(Request{HttpMethod::Put, url, {}, std::move(body)});
    }

    TransportResult RestClient::patch(const std::string& url,
                                      std::string body) {
        return send(Request{HttpMethod::Patch, url, {}, std::move(body)});
    }

    // Beast stream timeouts only apply to asynchronous operations, so each
    // blocking step is an async operation driven to completion on io_.
    template <typename Initiate>
    boost::system::error_code RestClient::run_with_timeout(
        beast::tcp_stream& stream, std::chrono::milliseconds timeout,
        Initiate&& initiate) {
        boost::system::error_code result = net::error::would_block;
        stream.expires_after(timeout);
        std::forward<Initiate>(initiate)(
            [&result](boost::system::error_code ec, auto&&...) {
                result = ec;
            });
        io_.restart();
        io_.run();
        stream.expires_never();
        return result;
    }

    template <typename Stream>
    TransportResult RestClient::exchange(Stream& stream, http_request& req) {
        auto& lowest = beast::get_lowest_layer(stream);

        auto ec = run_with_timeout(lowest, m_config.request_timeout,
                                   [&](auto handler) {
                                       http::async_write(stream, req,
                                                         std::move(handler));
                                   });
        if (ec) {
            close();
            return TransportResult::err(make_error(
                ec, TransportError::Code::SendFailed, "Write failed: "));
        }

        m_buffer.consume(m_buffer.size());  // clear but keep capacity
        http::response_parser<http::string_body> parser;
        parser.body_limit(m_config.max_body_bytes);

        ec = run_with_timeout(lowest, m_config.request_timeout,
                              [&](auto handler) {
                                  http::async_read(stream, m_buffer, parser,
                                                   std::move(handler));
                              });
        if (ec) {
            close();
            return TransportResult::err(make_error(
                ec, TransportError::Code::ReceiveFailed, "Read failed: "));
        }

        const bool keep_alive = parser.get().keep_alive();
        Response out = parse_beast_response(parser.release());
        if (!keep_alive) {
            close();
        }
        return TransportResult::ok(std::move(out));
    }

    // Name lookup runs on Asio's resolver thread and cannot be interrupted,
    // so on timeout the io_context is stopped and the late completion is
    // left to land in shared state.
    boost::system::error_code RestClient::resolve(
        const UrlComponents& u, tcp::resolver::results_type& out) {
        struct State {
            boost::system::error_code ec = net::error::would_block;
            tcp::resolver::results_type results;
            bool done = false;
        };
        auto state = std::make_shared<State>();
        auto timer =
            std::make_shared<net::steady_timer>(io_, m_config.connect_timeout);

        timer->async_wait([this, state](boost::system::error_code ec) {
            if (ec || state->done) return;
            state->done = true;
            state->ec = beast::error::timeout;
            m_resolver.cancel();
            io_.stop();
        });
        m_resolver.async_resolve(
            u.host, u.port,
            [state, timer](boost::system::error_code ec,
                           tcp::resolver::results_type results) {
                if (state->done) return;
                state->done = true;
                state->ec = ec;
                state->results = std::move(results);
                timer->cancel();
            });

        io_.restart();
        io_.run();
        out = std::move(state->results);
        return state->ec;
    }

    std::optional<TransportError> RestClient::ensure_connected(
        const UrlComponents& u) {
        const Endpoint wanted{u.host, u.port, u.https};

        if (m_connection == wanted) {
            if (u.https && m_https_stream &&
                beast::get_lowest_layer(*m_https_stream).socket().is_open()) {
                return std::nullopt;
            }
            if (!u.https && m_http_stream &&
                m_http_stream->socket().is_open()) {
                return std::nullopt;
            }
        }

        // Endpoint changed or dead socket: rebuild.
        close();

        tcp::resolver::results_type results;
        auto ec = resolve(u, results);
        if (ec) {
            return make_error(ec, TransportError::Code::ConnectionFailed,
                              "Resolve failed: ");
        }

        if (!u.https) {
            m_http_stream.emplace(io_);
            ec = run_with_timeout(*m_http_stream, m_config.connect_timeout,
                                  [&](auto handler) {
                                      m_http_stream->async_connect(
                                          results, std::move(handler));
                                  });
            if (ec) {
                close_http();
                return make_error(ec, TransportError::Code::ConnectionFailed,
                                  "Connect failed: ");
            }
            m_connection = wanted;
            return std::nullopt;
        }

        m_https_stream.emplace(io_, m_ssl_context);

        if (!set_sni(*m_https_stream, u.host, ec)) {
            close_https();
            return make_error(ec, TransportError::Code::TlsHandshakeFailed,
                              "SNI setup failed: ");
        }

        auto& lowest = beast::get_lowest_layer(*m_https_stream);
        ec = run_with_timeout(lowest, m_config.connect_timeout,
                              [&](auto handler) {
                                  lowest.async_connect(results,
                                                       std::move(handler));
                              });
        if (ec) {
            close_https();
            return make_error(ec, TransportError::Code::ConnectionFailed,
                              "Connect failed: ");
        }

        ec = run_with_timeout(lowest, m_config.connect_timeout,
                              [&](auto handler) {
                                  m_https_stream->async_handshake(
                                      ssl::stream_base::client,
                                      std::move(handler));
                              });
        if (ec) {
            close_https();
            return make_error(ec, TransportError::Code::TlsHandshakeFailed,
                              "TLS handshake failed: ");
        }

        m_connection = wanted;
        return std::nullopt;
    }

    void RestClient::close_http() {
        if (m_http_stream) {
            boost::system::error_code ec;
            m_http_stream->socket().shutdown(tcp::socket::shutdown_both, ec);
            m_http_stream->socket().close(ec);
            m_http_stream.reset();
        }
        if (!m_connection.https) m_connection.clear();
    }

    void RestClient::close_https() {
        if (m_https_stream) {
            auto& lowest = beast::get_lowest_layer(*m_https_stream);
            if (lowest.socket().is_open()) {
                // Best effort TLS shutdown; eof and stream_truncated are the
                // usual outcomes and are not errors here.
                static_cast<void>(run_with_timeout(
                    lowest, m_config.connect_timeout, [&](auto handler) {
                        m_https_stream->async_shutdown(std::move(handler));
                    }));
            }
            boost::system::error_code ec;
            lowest.socket().close(ec);
            m_https_stream.reset();
        }
        if (m_connection.https) m_connection.clear();
    }

    void RestClient::close() {
        close_http();
        close_https();
    }

}  // namespace supabase_auth

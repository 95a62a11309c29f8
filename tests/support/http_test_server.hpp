#pragma once

// In-process HTTP/1.1 server for transport tests. Serves each connection on
// a background thread and, unless keep-alive is honored, closes after every
// response so tests never hang.

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace supabase_auth::test {

    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = net::ip::tcp;

    struct HttpTestServer {
        using Handler =
            std::function<void(const http::request<http::string_body>&,
                               http::response<http::string_body>&)>;

        explicit HttpTestServer(Handler h, bool honor_keep_alive = false)
            : handler_(std::move(h)),
              honor_keep_alive_(honor_keep_alive),
              ioc_(1),
              acceptor_(ioc_) {
            tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
            beast::error_code ec;

            acceptor_.open(ep.protocol(), ec);
            if (ec) throw beast::system_error(ec);

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec) throw beast::system_error(ec);

            acceptor_.bind(ep, ec);
            if (ec) throw beast::system_error(ec);

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec) throw beast::system_error(ec);

            port_ = acceptor_.local_endpoint().port();

            thread_ = std::thread([this] { this->run(); });

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        ~HttpTestServer() {
            stop_.store(true, std::memory_order_relaxed);

            // Wake a blocking accept() so run() can observe stop_.
            beast::error_code ec;
            {
                net::io_context tmp_ioc;
                tcp::socket s(tmp_ioc);
                s.connect(
                    tcp::endpoint(net::ip::make_address("127.0.0.1"), port_),
                    ec);
            }
            if (thread_.joinable()) thread_.join();
            acceptor_.close(ec);
        }

        uint16_t port() const noexcept { return port_; }

        std::atomic<int> request_count{0};
        std::string last_method;
        std::string last_target;
        std::string last_body;
        std::unordered_map<std::string, std::string> last_headers;

       private:
        void run() {
            while (!stop_.load(std::memory_order_relaxed)) {
                beast::error_code ec;
                tcp::socket sock{ioc_};
                acceptor_.accept(sock, ec);
                if (ec) {
                    continue;
                }

                beast::tcp_stream stream(std::move(sock));
                beast::flat_buffer buffer;

                for (;;) {
                    if (stop_.load(std::memory_order_relaxed)) break;

                    // Bound how long we can block waiting for the next request.
                    stream.expires_after(std::chrono::milliseconds(200));
                    http::request<http::string_body> req;
                    http::read(stream, buffer, req, ec);

                    if (ec == beast::error::timeout ||
                        ec == http::error::end_of_stream) {
                        break;
                    }
                    if (ec) break;

                    request_count.fetch_add(1, std::memory_order_relaxed);
                    last_method = std::string(req.method_string());
                    last_target = std::string(req.target());
                    last_body = req.body();
                    last_headers.clear();
                    for (const auto& field : req) {
                        last_headers[std::string(field.name_string())] =
                            std::string(field.value());
                    }

                    http::response<http::string_body> res;
                    res.version(req.version());
                    res.keep_alive(req.keep_alive());

                    handler_(req, res);

                    if (res.result() == http::status::unknown) {
                        res.result(http::status::ok);
                    }
                    if (!res.has_content_length() && !res.body().empty()) {
                        res.prepare_payload();
                    }

                    // Default: close after each response so tests never hang.
                    if (!honor_keep_alive_) {
                        res.keep_alive(false);
                        res.set(http::field::connection, "close");
                    }

                    stream.expires_after(std::chrono::milliseconds(200));
                    http::write(stream, res, ec);
                    if (ec) break;

                    if (!honor_keep_alive_ || !res.keep_alive()) {
                        break;
                    }
                }

                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
                stream.socket().close(ec);
            }
        }

        Handler handler_;
        bool honor_keep_alive_{false};
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::thread thread_;
        std::atomic<bool> stop_{false};
        uint16_t port_{0};
    };

    inline std::string make_url(uint16_t port, std::string path) {
        if (path.empty() || path[0] != '/') path.insert(path.begin(), '/');
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

    /// @brief A loopback port with nothing listening on it.
    inline uint16_t unused_port() {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc,
                               tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        const uint16_t port = acceptor.local_endpoint().port();
        acceptor.close();
        return port;
    }

}  // namespace supabase_auth::test

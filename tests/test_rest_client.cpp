#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "supabase_auth/config.hpp"
#include "supabase_auth/request.hpp"
#include "supabase_auth/response.hpp"
#include "supabase_auth/rest_client.hpp"
#include "support/http_test_server.hpp"

using supabase_auth::RestClient;
using supabase_auth::RestClientConfiguration;
using supabase_auth::TransportError;
using supabase_auth::test::HttpTestServer;
using supabase_auth::test::make_url;
namespace http = supabase_auth::test::http;

namespace {

    RestClientConfiguration make_cfg(
        std::optional<std::string> base_url = std::nullopt) {
        RestClientConfiguration cfg{};
        cfg.base_url = std::move(base_url);
        cfg.user_agent = "supabase_auth_gtest";
        cfg.max_body_bytes = 1024 * 1024;
        cfg.connect_timeout = std::chrono::milliseconds(1000);
        cfg.request_timeout = std::chrono::milliseconds(1000);
        return cfg;
    }

}  // namespace

TEST(RestClientSync, GetAbsoluteUrlOk) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.target() == "/ok") {
            res.result(http::status::ok);
            res.set(http::field::content_type, "text/plain");
            res.body() = "hello";
            res.prepare_payload();
            return;
        }
        res.result(http::status::not_found);
        res.body() = "nope";
        res.prepare_payload();
    });

    RestClient c(make_cfg());
    auto r = c.get(make_url(srv.port(), "/ok"));
    ASSERT_FALSE(r.has_error()) << r.error().message;

    auto& out = r.value();
    EXPECT_EQ(out.status_code, 200);
    EXPECT_EQ(out.body, "hello");
    EXPECT_EQ(srv.last_headers["User-Agent"], "supabase_auth_gtest");
}

TEST(RestClientSync, ErrorStatusIsAValue) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::bad_request);
        res.body() = R"({"code":400,"msg":"bad"})";
        res.prepare_payload();
    });

    RestClient c(make_cfg());
    auto r = c.get(make_url(srv.port(), "/x"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().status_code, 400);
    EXPECT_FALSE(r.value().is_success());
}

TEST(RestClientSync, RelativeUrlWithBaseUrlResolves) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.target() == "/auth/v1/health") {
            res.result(http::status::ok);
            res.body() = "pong";
            res.prepare_payload();
            return;
        }
        res.result(http::status::not_found);
        res.body() = "bad";
        res.prepare_payload();
    });

    RestClient c(make_cfg(make_url(srv.port(), "/auth/v1")));

    auto r = c.get("/health");
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status_code, 200);
    EXPECT_EQ(r.value().body, "pong");
}

TEST(RestClientSync, RelativeUrlWithoutBaseUrlErrors) {
    RestClient c(make_cfg(std::nullopt));

    auto r = c.get("/health");
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, TransportError::Code::InvalidUrl);
}

TEST(RestClientSync, InvalidBaseUrlThrows) {
    EXPECT_THROW(RestClient c(make_cfg("localhost:1234")),
                 std::invalid_argument);
}

TEST(RestClientSync, PostEchoBody) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.method() == http::verb::post && req.target() == "/echo") {
            res.result(http::status::ok);
            res.set(http::field::content_type, "text/plain");
            res.body() = req.body();
            res.prepare_payload();
            return;
        }
        res.result(http::status::bad_request);
        res.body() = "bad";
        res.prepare_payload();
    });

    RestClient c(make_cfg());

    auto r = c.post(make_url(srv.port(), "/echo"), "abc123");
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status_code, 200);
    EXPECT_EQ(r.value().body, "abc123");

    EXPECT_EQ(srv.last_method, "POST");
    EXPECT_EQ(srv.last_target, "/echo");
    EXPECT_EQ(srv.last_body, "abc123");
}

TEST(RestClientSync, ConvenienceVerbsHitCorrectMethods) {
    HttpTestServer srv([](auto const& req, auto& res) {
        res.result(http::status::ok);
        res.body() =
            std::string(req.method_string()) + " " + std::string(req.target());
        res.prepare_payload();
    });

    RestClient c(make_cfg());
    {
        auto r = c.get(make_url(srv.port(), "/x"));
        ASSERT_FALSE(r.has_error());
        EXPECT_EQ(r.value().body, "GET /x");
    }
    {
        auto r = c.del(make_url(srv.port(), "/x"));
        ASSERT_FALSE(r.has_error());
        EXPECT_EQ(r.value().body, "DELETE /x");
    }
    {
        auto r = c.put(make_url(srv.port(), "/x"), "p");
        ASSERT_FALSE(r.has_error());
        EXPECT_EQ(r.value().body, "PUT /x");
    }
    {
        auto r = c.patch(make_url(srv.port(), "/x"), "q");
        ASSERT_FALSE(r.has_error());
        EXPECT_EQ(r.value().body, "PATCH /x");
    }
}

TEST(RestClientSync, DefaultHeadersDoNotOverrideRequestHeaders) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::ok);
        res.body() = "ok";
        res.prepare_payload();
    });

    auto cfg = make_cfg();
    cfg.default_headers["X-Client-Info"] = "supabase-auth-cpp";
    cfg.default_headers["apikey"] = "default";
    RestClient c(cfg);

    supabase_auth::Request req{supabase_auth::HttpMethod::Get,
                               make_url(srv.port(), "/h"),
                               {{"apikey", "explicit"}},
                               std::nullopt};
    auto r = c.send(req);
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(srv.last_headers["X-Client-Info"], "supabase-auth-cpp");
    EXPECT_EQ(srv.last_headers["apikey"], "explicit");
}

TEST(RestClientSync, ServerClosingConnectionAllowsNextRequest) {
    std::atomic<int> n{0};

    HttpTestServer srv(
        [&](auto const&, auto& res) {
            int k = ++n;
            res.result(http::status::ok);
            res.body() = (k == 1) ? "first" : "second";
            res.keep_alive(false);
            res.set(http::field::connection, "close");
            res.prepare_payload();
        },
        /*honor_keep_alive=*/true);

    RestClient c(make_cfg());

    auto r1 = c.get(make_url(srv.port(), "/ka"));
    ASSERT_FALSE(r1.has_error()) << r1.error().message;
    EXPECT_EQ(r1.value().body, "first");

    auto r2 = c.get(make_url(srv.port(), "/ka"));
    ASSERT_FALSE(r2.has_error()) << r2.error().message;
    EXPECT_EQ(r2.value().body, "second");

    EXPECT_GE(srv.request_count.load(), 2);
}

TEST(RestClientSync, SwitchingEndpointsWorks) {
    HttpTestServer srv1([](auto const&, auto& res) {
        res.result(http::status::ok);
        res.body() = "one";
        res.prepare_payload();
    });
    HttpTestServer srv2([](auto const&, auto& res) {
        res.result(http::status::ok);
        res.body() = "two";
        res.prepare_payload();
    });

    RestClient c(make_cfg());

    auto r1 = c.get(make_url(srv1.port(), "/who"));
    ASSERT_FALSE(r1.has_error()) << r1.error().message;
    EXPECT_EQ(r1.value().body, "one");

    auto r2 = c.get(make_url(srv2.port(), "/who"));
    ASSERT_FALSE(r2.has_error()) << r2.error().message;
    EXPECT_EQ(r2.value().body, "two");
}

TEST(RestClientSync, UnknownMethodReturnsError) {
    RestClient c(make_cfg());

    supabase_auth::Request req{};
    req.method = static_cast<supabase_auth::HttpMethod>(0x7f);
    req.url = "http://127.0.0.1:1/ok";

    auto r = c.send(req);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, TransportError::Code::Unknown);
}

TEST(RestClientSync, ConnectionRefused) {
    RestClient c(make_cfg());
    auto r = c.get(make_url(supabase_auth::test::unused_port(), "/ok"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, TransportError::Code::ConnectionFailed);
    EXPECT_TRUE(r.error().ec);
}

TEST(RestClientSync, NameLookupIsBoundedByConnectTimeout) {
    auto cfg = make_cfg();
    cfg.connect_timeout = std::chrono::milliseconds(300);
    RestClient c(cfg);

    const auto start = std::chrono::steady_clock::now();
    auto r = c.get("http://unresolvable-host.invalid/health");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.has_error());
    EXPECT_TRUE(r.error().code == TransportError::Code::ConnectionFailed ||
                r.error().code == TransportError::Code::Timeout)
        << r.error().message;
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(RestClientSync, SlowServerTimesOut) {
    HttpTestServer srv([](auto const&, auto& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        res.result(http::status::ok);
        res.body() = "late";
        res.prepare_payload();
    });

    auto cfg = make_cfg();
    cfg.request_timeout = std::chrono::milliseconds(100);
    RestClient c(cfg);

    auto r = c.get(make_url(srv.port(), "/slow"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, TransportError::Code::Timeout);
}

TEST(RestClientSync, BodyLimitIsEnforced) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::ok);
        res.body() = std::string(4096, 'x');
        res.prepare_payload();
    });

    auto cfg = make_cfg();
    cfg.max_body_bytes = 1024;
    RestClient c(cfg);

    auto r = c.get(make_url(srv.port(), "/big"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, TransportError::Code::ReceiveFailed);
}

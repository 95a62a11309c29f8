#pragma once
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "http_method.hpp"
#include "url.hpp"

namespace supabase_auth {

    using Headers = std::unordered_map<std::string, std::string>;

    using http_request =
        boost::beast::http::request<boost::beast::http::string_body>;

    /// One outgoing HTTP exchange. `url` is absolute or relative to the
    /// client's base URL.
    struct Request {
        HttpMethod method;
        std::string url;
        Headers headers;
        std::optional<std::string> body;
    };

    /// @brief Copy headers into a Beast field container.
    /// @param overwrite When false, names already present in `out` are kept.
    ///        Name comparison is case-insensitive.
    inline void apply_request_headers(const Headers& in,
                                      boost::beast::http::fields& out,
                                      bool overwrite = true) {
        for (const auto& [name, value] : in) {
            if (!overwrite && out.find(name) != out.end()) continue;
            out.set(name, value);
        }
    }

    /// @brief Build the wire request for `req` against the resolved `url`.
    ///
    /// Request headers take precedence over `defaults`. A body without an
    /// explicit Content-Type is sent as JSON.
    inline http_request prepare_beast_request(const Request& req,
                                              const UrlComponents& url,
                                              const std::string& user_agent,
                                              const Headers& defaults = {},
                                              bool keep_alive = true) {
        namespace http = boost::beast::http;
        http_request out;
        out.version(11);
        out.method(to_beast_verb(req.method));
        out.target(url.target);
        out.set(http::field::host, url.host);
        out.set(http::field::user_agent, user_agent);
        out.keep_alive(keep_alive);

        apply_request_headers(req.headers, out.base());
        apply_request_headers(defaults, out.base(), false);

        if (req.body.has_value()) {
            if (out.find(http::field::content_type) == out.end()) {
                out.set(http::field::content_type, "application/json");
            }
            out.body() = *req.body;
            out.prepare_payload();
        }
        return out;
    }

}  // namespace supabase_auth

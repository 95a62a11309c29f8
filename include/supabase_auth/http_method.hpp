#pragma once
#include <boost/beast/http/verb.hpp>
#include <string_view>

namespace supabase_auth {
    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
    };

    inline constexpr boost::beast::http::verb to_beast_verb(HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            default:
                return http::verb::unknown;
        }
    }

    inline constexpr std::string_view to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            default:
                return "UNKNOWN";
        }
    }

}  // namespace supabase_auth

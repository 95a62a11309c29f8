#pragma once

#include <string>
#include <string_view>

#include "result.hpp"
#include "transport_error.hpp"

namespace supabase_auth {

    /// Connection target split out of an http(s) URL.
    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // Request target (path and query). For a base URL this is the path
        // prefix without a trailing slash, "" for the root.
        std::string target;
    };

    using UrlResult = Result<UrlComponents, TransportError>;

    /// @brief Parse an absolute http:// or https:// URL.
    ///
    /// The scheme is matched case-insensitively, the port defaults from the
    /// scheme and must be within 1-65535, and a fragment is dropped. URLs
    /// carrying credentials are rejected.
    UrlResult parse_url(std::string_view url);

    /// @brief Parse the root that relative request paths are sent against.
    /// Queries and fragments are rejected; trailing slashes are removed.
    UrlResult parse_base_url(std::string_view url);

    /// @brief Absolute URLs are parsed as-is; anything else is appended to
    /// `base`, which must come from parse_base_url. `base` may be null.
    UrlResult resolve_url(std::string_view url, const UrlComponents* base);

    /// @brief Concatenate a root URL and a path with exactly one '/' between.
    std::string join_url_path(std::string_view root, std::string_view path);

}  // namespace supabase_auth

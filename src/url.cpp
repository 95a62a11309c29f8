#include "supabase_auth/url.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <optional>

namespace supabase_auth {

    namespace {
        constexpr std::string_view kSchemeSep = "://";

        UrlResult invalid(std::string what, std::string_view url) {
            return UrlResult::err(
                TransportError{TransportError::Code::InvalidUrl,
                               std::move(what) + ": '" + std::string(url) +
                                   "'"});
        }

        /// true for https, false for http, empty for anything else.
        std::optional<bool> scheme_is_https(std::string_view url) {
            const auto sep = url.find(kSchemeSep);
            if (sep == std::string_view::npos) return std::nullopt;
            const auto scheme = url.substr(0, sep);
            if (boost::algorithm::iequals(scheme, "https")) return true;
            if (boost::algorithm::iequals(scheme, "http")) return false;
            return std::nullopt;
        }

        bool valid_port(std::string_view port) {
            if (port.empty() || port.size() > 5) return false;
            unsigned value = 0;
            for (char c : port) {
                if (c < '0' || c > '9') return false;
                value = value * 10 + static_cast<unsigned>(c - '0');
            }
            return value >= 1 && value <= 65535;
        }

        bool valid_host(std::string_view host) {
            if (host.empty()) return false;
            for (char c : host) {
                const auto u = static_cast<unsigned char>(c);
                if (u <= 0x20 || u == 0x7f || c == '\\' || c == '%') {
                    return false;
                }
            }
            return true;
        }

        void strip_trailing_slashes(std::string& s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
        }
    }  // namespace

    UrlResult parse_url(std::string_view url) {
        const auto https = scheme_is_https(url);
        if (!https) {
            return invalid("URL must start with http:// or https://", url);
        }

        std::string_view rest =
            url.substr(url.find(kSchemeSep) + kSchemeSep.size());
        if (auto hash = rest.find('#'); hash != std::string_view::npos) {
            rest = rest.substr(0, hash);
        }

        const auto authority_end = rest.find_first_of("/?");
        const std::string_view authority = rest.substr(0, authority_end);
        if (authority.find('@') != std::string_view::npos) {
            return invalid("URL must not carry credentials", url);
        }

        UrlComponents out;
        out.https = *https;
        out.port = *https ? "443" : "80";

        std::string_view host = authority;
        if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            const auto port = authority.substr(colon + 1);
            if (!valid_port(port)) {
                return invalid("URL has an invalid port", url);
            }
            out.port = std::string(port);
        }
        if (!valid_host(host)) {
            return invalid("URL has an invalid host", url);
        }
        out.host = std::string(host);

        if (authority_end == std::string_view::npos) {
            out.target = "/";
        } else {
            const auto tail = rest.substr(authority_end);
            out.target = tail.front() == '?' ? "/" + std::string(tail)
                                             : std::string(tail);
        }
        return UrlResult::ok(std::move(out));
    }

    UrlResult parse_base_url(std::string_view url) {
        if (url.find_first_of("?#") != std::string_view::npos) {
            return invalid("base URL must not have a query or fragment", url);
        }
        auto parsed = parse_url(url);
        if (parsed.has_error()) return parsed;

        UrlComponents base = std::move(parsed).value();
        strip_trailing_slashes(base.target);
        return UrlResult::ok(std::move(base));
    }

    UrlResult resolve_url(std::string_view url, const UrlComponents* base) {
        if (scheme_is_https(url)) return parse_url(url);

        if (base == nullptr || base->host.empty()) {
            return invalid("relative URL without a base URL", url);
        }

        UrlComponents out = *base;
        if (url.empty() || url.front() != '/') out.target += '/';
        out.target.append(url);
        return UrlResult::ok(std::move(out));
    }

    std::string join_url_path(std::string_view root, std::string_view path) {
        std::string out(root);
        strip_trailing_slashes(out);
        while (!path.empty() && path.front() == '/') path.remove_prefix(1);
        if (!path.empty()) {
            out += '/';
            out.append(path);
        }
        return out;
    }

}  // namespace supabase_auth

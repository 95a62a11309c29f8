#include "supabase_auth/config.hpp"

#include "supabase_auth/env.hpp"
#include "supabase_auth/header_value.hpp"
#include "supabase_auth/log.hpp"
#include "supabase_auth/url.hpp"

namespace supabase_auth {

    Result<ClientConfiguration> ClientConfiguration::from_env() {
        auto url = read_env(kEnvProjectUrl);
        if (url.has_error()) {
            return Result<ClientConfiguration>::err(std::move(url).error());
        }
        auto key = read_env(kEnvApiKey);
        if (key.has_error()) {
            return Result<ClientConfiguration>::err(std::move(key).error());
        }

        ClientConfiguration cfg;
        cfg.project_url = std::move(url).value();
        cfg.api_key = std::move(key).value();

        auto secret = read_env(kEnvJwtSecret);
        if (secret.has_value()) {
            cfg.jwt_secret = std::move(secret).value();
        } else if (secret.error().kind == EnvVarError::Kind::NotUnicode) {
            // Present but unusable is an error even for an optional variable.
            return Result<ClientConfiguration>::err(std::move(secret).error());
        }

        if (auto invalid = cfg.validate()) {
            return Result<ClientConfiguration>::err(std::move(*invalid));
        }

        SUPABASE_AUTH_DEBUG("configuration loaded from environment for "
                            << cfg.project_url);
        return Result<ClientConfiguration>::ok(std::move(cfg));
    }

    std::optional<AuthError> ClientConfiguration::validate() const {
        if (parse_base_url(auth_url()).has_error()) {
            return AuthError(AuthError::ParseUrlError{});
        }
        auto key = HeaderValue::from_string(api_key);
        if (key.has_error()) {
            return AuthError(std::move(key).error());
        }
        return std::nullopt;
    }

    std::string ClientConfiguration::auth_url() const {
        return join_url_path(project_url, auth_path);
    }

    RestClientConfiguration ClientConfiguration::to_rest_config() const {
        RestClientConfiguration rest;
        rest.base_url = auth_url();
        rest.user_agent = user_agent;
        rest.connect_timeout = connect_timeout;
        rest.request_timeout = request_timeout;
        rest.max_body_bytes = max_body_bytes;
        rest.verify_tls = verify_tls;
        return rest;
    }

}  // namespace supabase_auth

#include "supabase_auth/api_client.hpp"

#include <stdexcept>

#include "supabase_auth/header_value.hpp"
#include "supabase_auth/log.hpp"
#include "supabase_auth/remote_error_payload.hpp"

namespace supabase_auth {

    namespace {
        ClientConfiguration checked(ClientConfiguration config) {
            if (auto invalid = config.validate()) {
                throw std::invalid_argument("Invalid client configuration: " +
                                            invalid->to_string());
            }
            return config;
        }
    }  // namespace

    AuthError error_from_response(const Response& response) {
        auto payload = parse_json<RemoteErrorPayload>(response.body);
        if (payload.has_value()) {
            return AuthError::Supabase{std::move(payload).value()};
        }
        return AuthError::StatusError{response.status_code, response.body};
    }

    Result<std::unique_ptr<ApiClient>> ApiClient::create(
        ClientConfiguration config) {
        if (auto invalid = config.validate()) {
            return Result<std::unique_ptr<ApiClient>>::err(
                std::move(*invalid));
        }
        return Result<std::unique_ptr<ApiClient>>::ok(
            std::make_unique<ApiClient>(std::move(config)));
    }

    ApiClient::ApiClient(ClientConfiguration config)
        : m_config(checked(std::move(config))),
          m_rest(m_config.to_rest_config()) {}

    const ClientConfiguration& ApiClient::config() const noexcept {
        return m_config;
    }

    Result<Response> ApiClient::send(const ApiRequest& request) {
        if (request.requires_session && !request.access_token) {
            return Result<Response>::err(AuthError::NotAuthenticated{});
        }

        auto apikey = HeaderValue::from_string(m_config.api_key);
        if (apikey.has_error()) {
            return Result<Response>::err(std::move(apikey).error());
        }
        auto bearer = HeaderValue::from_string(
            "Bearer " + request.access_token.value_or(m_config.api_key));
        if (bearer.has_error()) {
            return Result<Response>::err(std::move(bearer).error());
        }

        Request req{request.method, request.path, {}, std::nullopt};
        req.headers["apikey"] = apikey.value().str();
        req.headers["Authorization"] = bearer.value().str();
        if (request.body) {
            try {
                req.body = request.body->dump();
            } catch (const nlohmann::json::type_error& e) {
                // Strings holding invalid UTF-8 cannot be serialized.
                return Result<Response>::err(e);
            }
        }

        SUPABASE_AUTH_DEBUG(to_string(request.method) << " " << request.path);

        auto transport = m_rest.send(req);
        if (transport.has_error()) {
            SUPABASE_AUTH_WARN(to_string(request.method)
                               << " " << request.path << " failed: "
                               << transport.error().message);
            return Result<Response>::err(std::move(transport).error());
        }

        Response response = std::move(transport).value();
        if (!response.is_success()) {
            AuthError error = error_from_response(response);
            SUPABASE_AUTH_WARN(to_string(request.method)
                               << " " << request.path << " returned "
                               << response.status_code << ": " << error);
            return Result<Response>::err(std::move(error));
        }
        return Result<Response>::ok(std::move(response));
    }

}  // namespace supabase_auth

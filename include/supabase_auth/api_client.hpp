#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "config.hpp"
#include "error.hpp"
#include "http_method.hpp"
#include "json.hpp"
#include "response.hpp"
#include "rest_client.hpp"
#include "result.hpp"

namespace supabase_auth {

    /**
     * @brief A call against the auth API.
     */
    struct ApiRequest {
        HttpMethod method{HttpMethod::Get};
        /** @brief Path relative to the auth API base, e.g. "/user". */
        std::string path;
        /** @brief JSON body; sent with Content-Type: application/json. */
        std::optional<nlohmann::json> body;
        /** @brief User access token. The api key is used when unset. */
        std::optional<std::string> access_token;
        /** @brief Fail with NotAuthenticated when no access token is set. */
        bool requires_session{false};
    };

    /**
     * @brief Classify a non-2xx response.
     * @return Supabase when the body is a GoTrue error object, otherwise
     * StatusError carrying the status code and the raw body.
     */
    AuthError error_from_response(const Response& response);

    /**
     * @brief Thin client for the Supabase Auth HTTP API.
     *
     * Every failure, whatever layer it comes from, is returned as an
     * AuthError: transport failures as NetworkError, bad JSON as ParseError,
     * bad header values as InvalidHeaderValue and error responses as
     * Supabase or StatusError.
     */
    class ApiClient {
       public:
        /// @brief Validate the configuration and build a client.
        static Result<std::unique_ptr<ApiClient>> create(
            ClientConfiguration config);

        /// @throws std::invalid_argument if the configuration does not
        /// validate. Prefer create().
        explicit ApiClient(ClientConfiguration config);

        ApiClient(const ApiClient&) = delete;
        ApiClient& operator=(const ApiClient&) = delete;

        [[nodiscard]] const ClientConfiguration& config() const noexcept;

        /// @brief Send a request. Only 2xx responses are returned as values.
        [[nodiscard]] Result<Response> send(const ApiRequest& request);

        template <typename T>
        [[nodiscard]] Result<T> get(
            std::string path,
            std::optional<std::string> access_token = std::nullopt) {
            return to_result_t<T>(send(ApiRequest{HttpMethod::Get,
                                                  std::move(path),
                                                  std::nullopt,
                                                  std::move(access_token)}));
        }

        template <typename T>
        [[nodiscard]] Result<T> post(
            std::string path, nlohmann::json body,
            std::optional<std::string> access_token = std::nullopt) {
            return to_result_t<T>(send(ApiRequest{
                HttpMethod::Post, std::move(path), std::move(body),
                std::move(access_token)}));
        }

        template <typename T>
        [[nodiscard]] Result<T> put(
            std::string path, nlohmann::json body,
            std::optional<std::string> access_token = std::nullopt) {
            return to_result_t<T>(send(ApiRequest{
                HttpMethod::Put, std::move(path), std::move(body),
                std::move(access_token)}));
        }

       private:
        template <typename T>
        Result<T> to_result_t(Result<Response>&& res) {
            if (res.has_error()) {
                return Result<T>::err(std::move(res).error());
            }
            return parse_json<T>(res.value().body);
        }

        ClientConfiguration m_config;
        RestClient m_rest;
    };

}  // namespace supabase_auth

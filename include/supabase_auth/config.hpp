#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "error.hpp"
#include "request.hpp"
#include "result.hpp"

namespace supabase_auth {
    /**
     * @brief Configuration for the synchronous RestClient.
     */
    struct RestClientConfiguration {
        /** @brief Optional base URL for the client. */
        std::optional<std::string> base_url;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"supabase_auth_cpp/1.0"};

        /** @brief Default headers to include in every request. */
        Headers default_headers;

        /** @brief Timeout for resolving and establishing a connection. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Timeout for writing a request and reading its response. */
        std::chrono::milliseconds request_timeout{5000};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};

        /** @brief Whether to verify SSL certificates. */
        bool verify_tls{true};
    };

    /// Environment variable holding the project URL.
    inline constexpr const char* kEnvProjectUrl = "SUPABASE_URL";
    /// Environment variable holding the project API (anon) key.
    inline constexpr const char* kEnvApiKey = "SUPABASE_API_KEY";
    /// Environment variable holding the JWT secret. Optional.
    inline constexpr const char* kEnvJwtSecret = "SUPABASE_JWT_SECRET";

    /**
     * @brief Configuration of a Supabase Auth client.
     */
    struct ClientConfiguration {
        /** @brief Project URL, e.g. https://abc.supabase.co */
        std::string project_url;

        /** @brief Project API key, sent as the `apikey` header. */
        std::string api_key;

        /** @brief JWT secret used to validate access tokens locally. */
        std::optional<std::string> jwt_secret;

        /** @brief Path of the auth API below the project URL. */
        std::string auth_path{"/auth/v1"};

        std::string user_agent{"supabase_auth_cpp/1.0"};
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds request_timeout{10000};
        std::size_t max_body_bytes{static_cast<std::size_t>(1024) * 1024U};
        bool verify_tls{true};

        /**
         * @brief Build a configuration from SUPABASE_URL, SUPABASE_API_KEY
         * and (optionally) SUPABASE_JWT_SECRET.
         * @return The validated configuration, or InvalidEnvironmentVariable
         * when a required variable is missing or not UTF-8, or the errors
         * reported by validate().
         */
        static Result<ClientConfiguration> from_env();

        /**
         * @brief Check that the project URL is an absolute http(s) URL and
         * that the api key can be sent as a header value.
         * @return ParseUrlError or InvalidHeaderValue on failure.
         */
        [[nodiscard]] std::optional<AuthError> validate() const;

        /// @brief Base URL of the auth API (project URL + auth path).
        [[nodiscard]] std::string auth_url() const;

        /// @brief Transport settings for the underlying RestClient.
        [[nodiscard]] RestClientConfiguration to_rest_config() const;
    };
}  // namespace supabase_auth

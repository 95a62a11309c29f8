#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace supabase_auth {

    /**
     * @brief Error body returned by the Supabase Auth (GoTrue) service with a
     * non-2xx response.
     *
     * Wire form:
     * @code
     * {"code":400,"error_code":"invalid_grant","msg":"Bad request",
     *  "error_id":"...","internal_error":...,"internal_message":...}
     * @endcode
     * Only `code` and `msg` are required; unknown keys are ignored.
     */
    struct RemoteErrorPayload {
        /** @brief HTTP-status-like code reported by the service. */
        std::int32_t code{0};
        /** @brief Short machine readable code, e.g. "invalid_grant". */
        std::optional<std::string> error_code;
        /** @brief Human readable message (wire key `msg`). */
        std::string message;
        /** @brief Opaque internal error detail. */
        std::optional<nlohmann::json> internal_error;
        /** @brief Opaque internal message detail. */
        std::optional<nlohmann::json> internal_message;
        /** @brief Correlation id for the failed request. */
        std::optional<std::string> error_id;

        /**
         * @brief Render as a multi-line diagnostic:
         * @code
         * Status Code {code} ({error_code}) [Error ID: {error_id}]
         * Internal message: {internal_message}
         * Internal error: {internal_error}
         * Message: {message}
         * @endcode
         * Bracketed parts and the two internal lines appear only when the
         * field is present. JSON values are written as compact JSON.
         */
        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const RemoteErrorPayload&,
                               const RemoteErrorPayload&) = default;
    };

    /// @brief nlohmann hook. Absent optionals are omitted, never null.
    void to_json(nlohmann::json& j, const RemoteErrorPayload& p);

    /// @brief nlohmann hook. Throws nlohmann::json::out_of_range when `code`
    /// or `msg` is missing and nlohmann::json::type_error on mistyped fields.
    void from_json(const nlohmann::json& j, RemoteErrorPayload& p);

    std::ostream& operator<<(std::ostream& os, const RemoteErrorPayload& p);

}  // namespace supabase_auth

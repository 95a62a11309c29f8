#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "env.hpp"
#include "header_value.hpp"
#include "json_error.hpp"
#include "remote_error_payload.hpp"
#include "transport_error.hpp"

namespace supabase_auth {

    namespace detail {
        template <typename T, typename V>
        struct is_variant_member : std::false_type {};

        template <typename T, typename... Ts>
        struct is_variant_member<T, std::variant<Ts...>>
            : std::disjunction<std::is_same<T, Ts>...> {};
    }  // namespace detail

    /**
     * @brief The single error type surfaced by every fallible operation of
     * the library.
     *
     * Exactly one alternative is active. Alternatives that wrap an error from
     * a lower layer keep that error by value as their cause. Callers branch
     * with is<>(), get_if<>() or by visiting variant().
     *
     * Lower layer errors convert implicitly:
     * @code
     * Result<Response> r = ...;
     * if (transport.has_error()) return Result<Response>::err(transport.error());
     * @endcode
     */
    class AuthError {
       public:
        struct AlreadySignedUp {};
        struct WrongCredentials {};
        struct UserNotFound {};
        struct NotAuthenticated {};
        struct MissingRefreshToken {};
        struct WrongToken {};
        struct InternalError {};
        struct NetworkError {
            TransportError cause;
        };
        struct ParseError {
            JsonError cause;
        };
        struct InvalidHeaderValue {
            HeaderValueError cause;
        };
        struct InvalidEnvironmentVariable {
            EnvVarError cause;
        };
        struct ParseUrlError {};
        struct Supabase {
            RemoteErrorPayload payload;
        };
        /// @brief A remote call failed with a status/message pair that is not
        /// a structured Supabase error body.
        struct StatusError {
            int status;
            std::string message;
        };

        using Variant =
            std::variant<AlreadySignedUp, WrongCredentials, UserNotFound,
                         NotAuthenticated, MissingRefreshToken, WrongToken,
                         InternalError, NetworkError, ParseError,
                         InvalidHeaderValue, InvalidEnvironmentVariable,
                         ParseUrlError, Supabase, StatusError>;

        /// @brief Construct from any alternative.
        template <typename Alt, typename = std::enable_if_t<
                                    detail::is_variant_member<
                                        std::decay_t<Alt>, Variant>::value>>
        AuthError(Alt&& alt)
            : m_error(std::in_place_type<std::decay_t<Alt>>,
                      std::forward<Alt>(alt)) {}

        // Lifting conversions

        AuthError(TransportError cause)
            : m_error(NetworkError{std::move(cause)}) {}

        AuthError(JsonError cause) : m_error(ParseError{std::move(cause)}) {}
        AuthError(const nlohmann::json::parse_error& cause)
            : AuthError(JsonError(cause)) {}
        AuthError(const nlohmann::json::invalid_iterator& cause)
            : AuthError(JsonError(cause)) {}
        AuthError(const nlohmann::json::type_error& cause)
            : AuthError(JsonError(cause)) {}
        AuthError(const nlohmann::json::out_of_range& cause)
            : AuthError(JsonError(cause)) {}
        AuthError(const nlohmann::json::other_error& cause)
            : AuthError(JsonError(cause)) {}

        AuthError(HeaderValueError cause)
            : m_error(InvalidHeaderValue{std::move(cause)}) {}

        AuthError(EnvVarError cause)
            : m_error(InvalidEnvironmentVariable{std::move(cause)}) {}

        template <typename Alt>
        [[nodiscard]] bool is() const noexcept {
            return std::holds_alternative<Alt>(m_error);
        }

        template <typename Alt>
        [[nodiscard]] const Alt* get_if() const noexcept {
            return std::get_if<Alt>(&m_error);
        }

        [[nodiscard]] const Variant& variant() const noexcept {
            return m_error;
        }

        /// @brief The display message of the active alternative.
        [[nodiscard]] std::string to_string() const;

        /// @brief Message of the wrapped cause, if the active alternative
        /// carries one.
        [[nodiscard]] std::optional<std::string> cause_message() const;

       private:
        Variant m_error;
    };

    std::ostream& operator<<(std::ostream& os, const AuthError& e);

}  // namespace supabase_auth

#include "supabase_auth/error.hpp"

namespace supabase_auth {

    namespace {
        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;
    }  // namespace

    std::string AuthError::to_string() const {
        return std::visit(
            overloaded{
                [](const AlreadySignedUp&) -> std::string {
                    return "User Already Exists";
                },
                [](const WrongCredentials&) -> std::string {
                    return "Invalid Credentials";
                },
                [](const UserNotFound&) -> std::string {
                    return "User Not Found";
                },
                [](const NotAuthenticated&) -> std::string {
                    return "Supabase Client not Authenticated";
                },
                [](const MissingRefreshToken&) -> std::string {
                    return "Missing Refresh Token";
                },
                [](const WrongToken&) -> std::string {
                    return "JWT Is Invalid";
                },
                [](const InternalError&) -> std::string {
                    return "Internal Error";
                },
                [](const NetworkError&) -> std::string {
                    return "Network Error";
                },
                [](const ParseError&) -> std::string {
                    return "Failed to Parse";
                },
                [](const InvalidHeaderValue&) -> std::string {
                    return "Header Value is Invalid";
                },
                [](const InvalidEnvironmentVariable&) -> std::string {
                    return "Environment Variable Unreadable";
                },
                [](const ParseUrlError&) -> std::string {
                    return "Failed to parse URL";
                },
                [](const Supabase& e) -> std::string {
                    return e.payload.to_string();
                },
                [](const StatusError& e) -> std::string {
                    return "Error: " + std::to_string(e.status) + ": " +
                           e.message;
                },
            },
            m_error);
    }

    std::optional<std::string> AuthError::cause_message() const {
        if (const auto* e = get_if<NetworkError>()) {
            return e->cause.message;
        }
        if (const auto* e = get_if<ParseError>()) {
            return e->cause.message();
        }
        if (const auto* e = get_if<InvalidHeaderValue>()) {
            return e->cause.message();
        }
        if (const auto* e = get_if<InvalidEnvironmentVariable>()) {
            return e->cause.message();
        }
        return std::nullopt;
    }

    std::ostream& operator<<(std::ostream& os, const AuthError& e) {
        return os << e.to_string();
    }

}  // namespace supabase_auth

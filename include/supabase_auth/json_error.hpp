#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <variant>

namespace supabase_auth {

    /**
     * @brief An exception thrown by nlohmann::json, kept as its concrete type.
     *
     * nlohmann exceptions are not assignable (their id is const), so the
     * exception is held behind an immutable shared pointer. Copies share
     * the same cause.
     */
    class JsonError {
       public:
        using Exception =
            std::variant<nlohmann::json::parse_error,
                         nlohmann::json::invalid_iterator,
                         nlohmann::json::type_error,
                         nlohmann::json::out_of_range,
                         nlohmann::json::other_error>;

        template <typename Ex,
                  typename = std::enable_if_t<
                      std::is_constructible_v<Exception, const Ex&> &&
                      std::is_base_of_v<nlohmann::json::exception, Ex>>>
        explicit JsonError(const Ex& ex)
            : m_exception(
                  std::make_shared<Exception>(std::in_place_type<Ex>, ex)) {}

        /// @brief nlohmann exception id (e.g. 101 for a syntax error).
        [[nodiscard]] int id() const noexcept {
            return std::visit([](const auto& ex) noexcept { return ex.id; },
                              *m_exception);
        }

        /// @brief what() of the wrapped exception.
        [[nodiscard]] std::string message() const {
            return std::visit(
                [](const auto& ex) { return std::string(ex.what()); },
                *m_exception);
        }

        [[nodiscard]] const Exception& exception() const noexcept {
            return *m_exception;
        }

        template <typename Ex>
        [[nodiscard]] const Ex* get_if() const noexcept {
            return std::get_if<Ex>(m_exception.get());
        }

       private:
        std::shared_ptr<const Exception> m_exception;
    };

}  // namespace supabase_auth

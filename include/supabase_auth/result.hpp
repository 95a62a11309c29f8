#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

namespace supabase_auth {

    class AuthError;

    /// @brief Result<T, E> represents either a successful value of type T or
    /// an error of type E.
    /// @tparam T The type of the successful value.
    /// @tparam E The error type. Defaults to the library-wide AuthError; the
    /// lower layers (transport, headers, environment) use their own error
    /// types which are lifted into AuthError at the client boundary.
    /// @note This is similar to std::expected<T, E> in C++23.
    template <typename T, typename E = AuthError>
    class [[nodiscard]] Result {
       public:
        using value_type = T;
        using error_type = E;

        /// @brief Create a successful Result with the given value.
        /// @tparam Args The types of the arguments to construct T.
        /// @param args The arguments to construct T.
        /// @return A Result containing the constructed T.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_index<0>, std::forward<Args>(args)...);
        }

        /// @brief Create an error Result with the given error.
        /// @param error The error to store in the Result.
        /// @return A Result containing the given error.
        static Result err(const E& error) {
            return Result(std::in_place_index<1>, error);
        }

        /// @brief Create an error Result with the given error.
        /// @param error The error to store in the Result.
        /// @return A Result containing the given error.
        static Result err(E&& error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        // State Inspection Methods

        /// @brief Allow `if (result) { ... }` to mean "if success".
        explicit operator bool() const noexcept { return has_value(); }

        /// @brief True if this Result currently holds a value of type T.
        bool has_value() const noexcept { return m_state.index() == 0; }

        /// @brief True if this Result currently holds an error.
        bool has_error() const noexcept { return m_state.index() == 1; }

        // Value Access Methods

        /// @brief Get the stored value (const lvalue overload).
        const T& value() const& {
            const T* p = value_ptr();
            assert(p && "Result::value() called but this Result holds an error");
            return *p;
        }

        /// @brief Get the stored value (mutable lvalue overload).
        T& value() & {
            T* p = value_ptr();
            assert(p && "Result::value() called but this Result holds an error");
            return *p;
        }

        /// @brief Get the stored value (rvalue overload).
        /// @return The stored T, moved out of the Result.
        T&& value() && {
            T* p = value_ptr();
            assert(p && "Result::value() called but this Result holds an error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<0>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept {
            return std::get_if<0>(&m_state);
        }

        /// @brief Get the stored error (const lvalue overload).
        const E& error() const& {
            const E* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Get the stored error (mutable lvalue overload).
        E& error() & {
            E* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        /// @brief Get the stored error (rvalue overload).
        E&& error() && {
            E* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        /// @brief Pointer access to the stored error, nullptr if a value.
        [[nodiscard]] const E* error_ptr() const noexcept {
            return std::get_if<1>(&m_state);
        }

        [[nodiscard]] E* error_ptr() noexcept {
            return std::get_if<1>(&m_state);
        }

        // User Convenience Methods

        /// @brief Return the stored value if present, otherwise call a fallback
        /// function. make_fallback() is only invoked when there is no value.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        /// @brief Rvalue overload of value_or_else to preserve move semantics.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        /// @brief Eager fallback: return stored value if present, otherwise
        /// return fallback.
        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @brief Return the stored error if present, otherwise the provided
        /// fallback reference.
        const E& error_or(const E& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_index_t<0>, Args&&... args)
            : m_state(std::in_place_index<0>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_index_t<1>, const E& error)
            : m_state(std::in_place_index<1>, error) {}

        explicit Result(std::in_place_index_t<1>, E&& error)
            : m_state(std::in_place_index<1>, std::move(error)) {}

        /// @brief Storage: exactly one of {T, E} is active at any time.
        std::variant<T, E> m_state;
    };

}  // namespace supabase_auth

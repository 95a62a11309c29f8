#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "result.hpp"

namespace supabase_auth {

    /**
     * @brief A string could not be used as an HTTP header value.
     */
    struct HeaderValueError {
        /** @brief The rejected input. */
        std::string value;
        /** @brief Offset of the first byte that is not allowed. */
        std::size_t position{0};

        [[nodiscard]] std::string message() const {
            return "failed to parse header value";
        }

        friend bool operator==(const HeaderValueError&,
                               const HeaderValueError&) = default;
    };

    /**
     * @brief A validated HTTP header value.
     *
     * Accepts visible ASCII, SP, HTAB and obs-text (bytes >= 0x80). Any other
     * control byte (CR, LF, NUL, DEL, ...) is rejected so a value can never
     * split or terminate a header line.
     */
    class HeaderValue {
       public:
        static Result<HeaderValue, HeaderValueError> from_string(
            std::string value) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (!is_valid_byte(static_cast<unsigned char>(value[i]))) {
                    return Result<HeaderValue, HeaderValueError>::err(
                        HeaderValueError{std::move(value), i});
                }
            }
            return Result<HeaderValue, HeaderValueError>::ok(
                HeaderValue(std::move(value)));
        }

        [[nodiscard]] const std::string& str() const noexcept {
            return m_value;
        }

       private:
        explicit HeaderValue(std::string value) : m_value(std::move(value)) {}

        static constexpr bool is_valid_byte(unsigned char c) noexcept {
            return c == '\t' || (c >= 0x20 && c != 0x7f);
        }

        std::string m_value;
    };

}  // namespace supabase_auth

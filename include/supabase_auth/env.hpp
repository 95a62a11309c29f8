#pragma once
#include <string>
#include <string_view>

#include "result.hpp"

namespace supabase_auth {

    /**
     * @brief A process environment variable could not be read.
     */
    struct EnvVarError {
        enum class Kind {
            NotPresent, /**< The variable is not set. */
            NotUnicode, /**< The variable is set but is not valid UTF-8. */
        };

        Kind kind;
        /** @brief Name of the variable that was looked up. */
        std::string name;

        [[nodiscard]] std::string message() const {
            switch (kind) {
                case Kind::NotPresent:
                    return "environment variable not found";
                case Kind::NotUnicode:
                    return "environment variable was not valid unicode";
            }
            return "environment variable error";
        }

        friend bool operator==(const EnvVarError&,
                               const EnvVarError&) = default;
    };

    /// @brief True if `s` is well-formed UTF-8 (no overlongs, no surrogates).
    bool is_valid_utf8(std::string_view s) noexcept;

    /// @brief Read an environment variable of the current process.
    Result<std::string, EnvVarError> read_env(const std::string& name);

}  // namespace supabase_auth

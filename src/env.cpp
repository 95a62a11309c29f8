#include "supabase_auth/env.hpp"

#include <cstdlib>

namespace supabase_auth {

    bool is_valid_utf8(std::string_view s) noexcept {
        std::size_t i = 0;
        const std::size_t n = s.size();
        while (i < n) {
            const auto c = static_cast<unsigned char>(s[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t len = 0;
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) lo = 0xA0;  // overlong
                if (c == 0xED) hi = 0x9F;  // surrogates
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) lo = 0x90;  // overlong
                if (c == 0xF4) hi = 0x8F;  // > U+10FFFF
            } else {
                return false;
            }

            if (i + len > n) return false;

            // Only the first continuation byte has a narrowed range.
            const auto c1 = static_cast<unsigned char>(s[i + 1]);
            if (c1 < lo || c1 > hi) return false;
            for (std::size_t k = 2; k < len; ++k) {
                const auto ck = static_cast<unsigned char>(s[i + k]);
                if (ck < 0x80 || ck > 0xBF) return false;
            }
            i += len;
        }
        return true;
    }

    Result<std::string, EnvVarError> read_env(const std::string& name) {
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            return Result<std::string, EnvVarError>::err(
                EnvVarError{EnvVarError::Kind::NotPresent, name});
        }

        std::string value(raw);
        if (!is_valid_utf8(value)) {
            return Result<std::string, EnvVarError>::err(
                EnvVarError{EnvVarError::Kind::NotUnicode, name});
        }
        return Result<std::string, EnvVarError>::ok(std::move(value));
    }

}  // namespace supabase_auth

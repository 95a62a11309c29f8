#include "supabase_auth/remote_error_payload.hpp"

#include <cstdint>
#include <limits>

namespace supabase_auth {

    namespace {
        /// @brief Read an optional key; absent and null both mean "not set".
        template <typename T>
        void get_optional(const nlohmann::json& j, const char* key,
                          std::optional<T>& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                out.reset();
                return;
            }
            out = it->template get<T>();
        }

        /// @brief Decode `code` as a 32-bit integer. Booleans, floats and
        /// values outside the int32 range are rejected rather than narrowed.
        std::int32_t get_status_code(const nlohmann::json& v) {
            using limits = std::numeric_limits<std::int32_t>;
            if (!v.is_number_integer()) {
                throw nlohmann::json::type_error::create(
                    302,
                    std::string("type must be an integer, but is ") +
                        v.type_name(),
                    &v);
            }
            if (v.is_number_unsigned()) {
                const auto u = v.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(limits::max())) {
                    throw nlohmann::json::out_of_range::create(
                        406, "code " + v.dump() + " does not fit in int32", &v);
                }
                return static_cast<std::int32_t>(u);
            }
            const auto i = v.get<std::int64_t>();
            if (i < limits::min() || i > limits::max()) {
                throw nlohmann::json::out_of_range::create(
                    406, "code " + v.dump() + " does not fit in int32", &v);
            }
            return static_cast<std::int32_t>(i);
        }

        std::string dump_lossy(const nlohmann::json& v) {
            return v.dump(-1, ' ', false,
                          nlohmann::json::error_handler_t::replace);
        }
    }  // namespace

    std::string RemoteErrorPayload::to_string() const {
        std::string out = "Status Code " + std::to_string(code);

        if (error_code) {
            out += " (" + *error_code + ")";
        }
        if (error_id) {
            out += " [Error ID: " + *error_id + "]";
        }
        if (internal_message) {
            out += "\nInternal message: " + dump_lossy(*internal_message);
        }
        if (internal_error) {
            out += "\nInternal error: " + dump_lossy(*internal_error);
        }

        out += "\nMessage: " + message;
        return out;
    }

    void to_json(nlohmann::json& j, const RemoteErrorPayload& p) {
        j = nlohmann::json::object();
        j["code"] = p.code;
        if (p.error_code) j["error_code"] = *p.error_code;
        j["msg"] = p.message;
        if (p.internal_error) j["internal_error"] = *p.internal_error;
        if (p.internal_message) j["internal_message"] = *p.internal_message;
        if (p.error_id) j["error_id"] = *p.error_id;
    }

    void from_json(const nlohmann::json& j, RemoteErrorPayload& p) {
        p.code = get_status_code(j.at("code"));
        j.at("msg").get_to(p.message);
        get_optional(j, "error_code", p.error_code);
        get_optional(j, "internal_error", p.internal_error);
        get_optional(j, "internal_message", p.internal_message);
        get_optional(j, "error_id", p.error_id);
    }

    std::ostream& operator<<(std::ostream& os, const RemoteErrorPayload& p) {
        return os << p.to_string();
    }

}  // namespace supabase_auth

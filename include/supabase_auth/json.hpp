#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

#include "error.hpp"
#include "result.hpp"

namespace supabase_auth {

    /// @brief Deserialize a JSON document into T via nlohmann's from_json.
    /// Any nlohmann exception is lifted into AuthError::ParseError with its
    /// concrete type preserved.
    template <typename T>
    Result<T> parse_json(std::string_view body) {
        using json = nlohmann::json;
        try {
            return Result<T>::ok(json::parse(body).template get<T>());
        } catch (const json::parse_error& e) {
            return Result<T>::err(e);
        } catch (const json::type_error& e) {
            return Result<T>::err(e);
        } catch (const json::out_of_range& e) {
            return Result<T>::err(e);
        } catch (const json::invalid_iterator& e) {
            return Result<T>::err(e);
        } catch (const json::other_error& e) {
            return Result<T>::err(e);
        }
    }

}  // namespace supabase_auth

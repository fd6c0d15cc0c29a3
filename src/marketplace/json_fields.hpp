#pragma once

// Tolerant field readers shared by the marketplace adapters. Registry
// payloads are loosely typed; a field of the wrong type reads as absent.

#include <mcphub/core/result.hpp>
#include <mcphub/transport/i_http_client.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcphub {
namespace market {

inline const nlohmann::json* Field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) {
        return nullptr;
    }
    auto it = j.find(key);
    return it == j.end() || it->is_null() ? nullptr : &*it;
}

inline std::optional<std::string> OptString(const nlohmann::json& j, const char* key) {
    const auto* f = Field(j, key);
    if (f == nullptr || !f->is_string() || f->get<std::string>().empty()) {
        return std::nullopt;
    }
    return f->get<std::string>();
}

inline std::string String(const nlohmann::json& j, const char* key) {
    return OptString(j, key).value_or("");
}

inline std::optional<int64_t> OptInt(const nlohmann::json& j, const char* key) {
    const auto* f = Field(j, key);
    if (f == nullptr || !f->is_number()) {
        return std::nullopt;
    }
    return f->is_number_float() ? static_cast<int64_t>(f->get<double>()) : f->get<int64_t>();
}

inline std::optional<bool> OptBool(const nlohmann::json& j, const char* key) {
    const auto* f = Field(j, key);
    if (f == nullptr || !f->is_boolean()) {
        return std::nullopt;
    }
    return f->get<bool>();
}

// Check status and parse the body. `label` prefixes the status error,
// e.g. "Registry error: 503".
inline Result<nlohmann::json, Error> ParseRegistryReply(const std::string& operation,
                                                         const std::string& url,
                                                         const std::string& label,
                                                         const HttpResponse& response) {
    if (!response.IsSuccess()) {
        return Result<nlohmann::json, Error>::Err(
            Error{operation, url, response.status_code,
                  label + " error: " + std::to_string(response.status_code), std::nullopt,
                  ErrorCategory::Transport});
    }
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<nlohmann::json, Error>::Err(
            Error{operation, url, response.status_code,
                  label + " returned malformed JSON", std::nullopt,
                  ErrorCategory::Protocol});
    }
    return Result<nlohmann::json, Error>::Ok(std::move(parsed));
}

} // namespace market
} // namespace mcphub

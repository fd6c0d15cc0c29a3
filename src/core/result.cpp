#include <mcphub/core/result.hpp>

#include <nlohmann/json.hpp>

namespace mcphub {

namespace {

// Pull a human-readable message out of a JSON error body, if the server sent one.
// Registries answer with {"error": "..."}, {"error": {"message": "..."}} or {"message": "..."}.
std::optional<std::string> ExtractBodyMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    if (j.contains("error")) {
        const auto& err = j["error"];
        if (err.is_string()) return err.get<std::string>();
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
    }
    if (j.contains("message") && j["message"].is_string()) {
        return j["message"].get<std::string>();
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& target,
                            int status_code,
                            const std::string& response_body) {
    auto body_message = ExtractBodyMessage(response_body);

    ErrorCategory category = ErrorCategory::Transport;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
            message = "Unauthorized: check the configured credentials/headers";
            break;
        case 403:
            message = "Forbidden";
            break;
        case 404:
            message = "Not found";
            break;
        case 405:
            message = "Method not allowed";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            message = "Too many requests, retry later";
            break;
        case 500:
            message = "Server internal error";
            break;
        case 502:
        case 503:
            message = "Server unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (body_message.has_value()) {
        message += ": " + *body_message;
    }

    return Error{operation, target, status_code, message, std::nullopt, category};
}

Error Error::FromRpcError(const std::string& operation,
                          const std::string& target,
                          int code,
                          const std::string& message) {
    return Error{operation, target, std::nullopt, message, code,
                 ErrorCategory::Protocol};
}

std::string Error::ToJson() const {
    nlohmann::json err = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!target.empty()) {
        err["target"] = target;
    }
    if (http_status.has_value()) {
        err["http_status"] = *http_status;
    }
    if (rpc_code.has_value()) {
        err["rpc_code"] = *rpc_code;
    }
    return nlohmann::json{{"error", err}}.dump();
}

} // namespace mcphub

#include <mcphub/protocol/types.hpp>

namespace mcphub {

TransportKind KindOf(const TransportConfig& transport) {
    switch (transport.index()) {
        case 0: return TransportKind::Stdio;
        case 1: return TransportKind::Sse;
        default: return TransportKind::Http;
    }
}

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse:   return "sse";
        case TransportKind::Http:  return "http";
    }
    return "unknown";
}

std::string TransportTarget(const TransportConfig& transport) {
    if (const auto* stdio = std::get_if<StdioTransportConfig>(&transport)) {
        std::string line = stdio->command;
        for (const auto& arg : stdio->args) {
            line += ' ';
            line += arg;
        }
        return line;
    }
    if (const auto* sse = std::get_if<SseTransportConfig>(&transport)) {
        return sse->url;
    }
    return std::get<HttpTransportConfig>(transport).url;
}

std::optional<std::string> ToolCallResult::FirstText() const {
    for (const auto& block : content) {
        if (block.type == "text" && block.text.has_value()) {
            return block.text;
        }
    }
    return std::nullopt;
}

std::string ToolCallResult::JoinedText() const {
    std::string joined;
    for (const auto& block : content) {
        if (block.type != "text" || !block.text.has_value()) {
            continue;
        }
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += *block.text;
    }
    return joined;
}

const char* SyncStateName(SyncState state) {
    switch (state) {
        case SyncState::Idle:    return "idle";
        case SyncState::Syncing: return "syncing";
        case SyncState::Success: return "success";
        case SyncState::Error:   return "error";
    }
    return "idle";
}

} // namespace mcphub

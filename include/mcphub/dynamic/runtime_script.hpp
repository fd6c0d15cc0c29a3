#pragma once

#include <string_view>

namespace mcphub {

// The shared interpreter script that serves every dynamic service:
// `node mcp-runtime.js --dir <serviceDir>`. It speaks line-delimited
// JSON-RPC on stdio, reads `definition.json` for tools/list and dispatches
// tools/call to the matching export of `handlers.js`.
[[nodiscard]] std::string_view RuntimeScript();

constexpr std::string_view kRuntimeFileName = "mcp-runtime.js";
constexpr std::string_view kDefinitionFileName = "definition.json";
constexpr std::string_view kHandlersFileName = "handlers.js";

} // namespace mcphub

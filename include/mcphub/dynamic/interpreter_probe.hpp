#pragma once

#include <mcphub/dynamic/i_runtime_probe.hpp>

#include <optional>
#include <string_view>

namespace mcphub {

// Runs `<interpreter> --version` through the shell and returns its first
// output line.
class InterpreterProbe : public IRuntimeProbe {
public:
    InterpreterProbe() = default;

    Result<std::string, Error> Version(const std::string& interpreter) override;
};

// "v18.17.1" or "18.17.1" -> 18. nullopt when no leading number is present.
[[nodiscard]] std::optional<int> ParseMajorVersion(std::string_view version);

} // namespace mcphub

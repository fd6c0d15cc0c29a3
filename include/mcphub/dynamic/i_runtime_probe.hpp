#pragma once

#include <mcphub/core/result.hpp>

#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// IRuntimeProbe: asks a script interpreter for its version string.
// ---------------------------------------------------------------------------
class IRuntimeProbe {
public:
    virtual ~IRuntimeProbe() = default;

    // Raw version output, e.g. "v20.11.1". Err when the interpreter is absent.
    virtual Result<std::string, Error> Version(const std::string& interpreter) = 0;

    IRuntimeProbe(const IRuntimeProbe&) = delete;
    IRuntimeProbe& operator=(const IRuntimeProbe&) = delete;
    IRuntimeProbe(IRuntimeProbe&&) = delete;
    IRuntimeProbe& operator=(IRuntimeProbe&&) = delete;

protected:
    IRuntimeProbe() = default;
};

} // namespace mcphub

#pragma once

#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// IConfirmPrompt: blocking yes/no question put to the user. Used only by the
// security gate in front of generated-code services.
// ---------------------------------------------------------------------------
class IConfirmPrompt {
public:
    virtual ~IConfirmPrompt() = default;

    // true = approved.
    virtual bool Confirm(const std::string& title, const std::string& message) = 0;

    IConfirmPrompt(const IConfirmPrompt&) = delete;
    IConfirmPrompt& operator=(const IConfirmPrompt&) = delete;
    IConfirmPrompt(IConfirmPrompt&&) = delete;
    IConfirmPrompt& operator=(IConfirmPrompt&&) = delete;

protected:
    IConfirmPrompt() = default;
};

} // namespace mcphub

#pragma once

#include <mcphub/dynamic/i_confirm_prompt.hpp>

namespace mcphub {

// ---------------------------------------------------------------------------
// TerminalConfirmPrompt: FTXUI dialog with Approve / Decline buttons.
//
// Declines without showing anything when stdin is not a terminal, so
// unattended runs never launch generated code by accident.
// ---------------------------------------------------------------------------
class TerminalConfirmPrompt : public IConfirmPrompt {
public:
    TerminalConfirmPrompt() = default;

    bool Confirm(const std::string& title, const std::string& message) override;
};

} // namespace mcphub

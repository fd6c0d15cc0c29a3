#include <mcphub/cli/terminal_confirm_prompt.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/terminal.hpp>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

namespace mcphub {

bool TerminalConfirmPrompt::Confirm(const std::string& title, const std::string& message) {
    if (!IsStdinTty()) {
        LogWarn("dynamic", "No terminal to confirm \"" + title + "\"; declining");
        return false;
    }

    using namespace ftxui;

    bool approved = false;
    auto screen = ScreenInteractive::FitComponent();

    auto approve_button = Button(" Approve ", [&] {
        approved = true;
        screen.Exit();
    });
    auto decline_button = Button(" Decline ", [&] { screen.Exit(); });

    auto buttons = Container::Horizontal({decline_button, approve_button});

    // Escape declines.
    buttons |= CatchEvent([&](Event event) {
        if (event == Event::Escape) {
            screen.Exit();
            return true;
        }
        return false;
    });

    auto renderer = Renderer(buttons, [&] {
        return vbox({
                   text(title) | bold | color(Color::Yellow) | center,
                   separator(),
                   paragraph(message),
                   separator(),
                   hbox({
                       decline_button->Render(),
                       text("  "),
                       approve_button->Render(),
                   }) | center,
               }) |
               border | size(WIDTH, LESS_THAN, 72);
    });

    screen.Loop(renderer);
    return approved;
}

} // namespace mcphub

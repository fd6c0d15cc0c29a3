#include <catch2/catch_test_macros.hpp>

#include <mcphub/core/ansi.hpp>
#include <mcphub/core/terminal.hpp>

#include <cstdlib>
#include <string>

using namespace mcphub;

// ===========================================================================
// NO_COLOR
// ===========================================================================

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    const char* previous = std::getenv("NO_COLOR");
    std::string saved = previous != nullptr ? previous : "";

    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());

    if (previous != nullptr) {
        setenv("NO_COLOR", saved.c_str(), 1);
    }
}

// ===========================================================================
// ansi::Paint
// ===========================================================================

TEST_CASE("Paint: wraps text in the code and a reset", "[core][terminal]") {
    CHECK(ansi::Paint(ansi::kGreen, "OK") == "\033[1;32mOK\033[0m");
    CHECK(ansi::Paint(ansi::kBold, "") == "\033[1m\033[0m");
}

TEST_CASE("Paint: disabled returns the text unchanged", "[core][terminal]") {
    CHECK(ansi::Paint(ansi::kRed, "Error: ", false) == "Error: ");
}

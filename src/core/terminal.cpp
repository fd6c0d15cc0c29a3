#include <mcphub/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcphub {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdoutTty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool IsStdinTty() {
    return isatty(STDIN_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace mcphub

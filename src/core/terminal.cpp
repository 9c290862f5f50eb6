#include <apktool_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace apktool_mcp {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(STDERR_FILENO);
}

bool IsStdinTty() {
    return IsTerminal(STDIN_FILENO);
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace apktool_mcp

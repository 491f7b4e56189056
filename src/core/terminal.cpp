#include <mcp_echo/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_echo {

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

bool IsStderrTty() {
    return IsTerminal(STDERR_FILENO);
}

bool NoColorEnvSet() {
    const char* val = std::getenv("NO_COLOR");
    return val != nullptr;
}

bool ResolveLogColor(bool force_color, bool force_no_color) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || IsStderrTty();
}

} // namespace mcp_echo

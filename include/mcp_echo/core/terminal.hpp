#pragma once

namespace mcp_echo {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if stderr is a terminal (log output goes there).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Decide whether log output should be colored.
/// Explicit flags win; otherwise color only when stderr is a TTY and
/// NO_COLOR is unset.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace mcp_echo

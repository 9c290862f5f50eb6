#pragma once

namespace apktool_mcp {

/// True if the file descriptor is attached to a terminal.
bool IsTerminal(int fd);

/// Colored log output is only used when stderr is a terminal.
bool IsStderrTty();

/// An interactive stdin usually means someone started the server by hand.
bool IsStdinTty();

/// NO_COLOR set to anything disables color (https://no-color.org/).
bool NoColorEnvSet();

} // namespace apktool_mcp

#pragma once

namespace kmsg_mcp {

/// Returns true if stderr is a terminal. Logs are the only thing the bridge
/// writes there, so this alone decides whether log lines get colored.
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the color decision from explicit flags, NO_COLOR and the tty check.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace kmsg_mcp

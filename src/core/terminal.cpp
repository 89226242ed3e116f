#include <kmsg_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace kmsg_mcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
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

} // namespace kmsg_mcp

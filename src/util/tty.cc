#include "tty.hpp"

#include <cstdlib>
#include <string>

#ifdef MINPATCH_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace minpatch;

TerminalColorCapability
minpatch::tty_get_color_capability(int fd) {
#ifdef MINPATCH_PLATFORM_POSIX
    // Diagnostics redirected to a file or a pipe stay plain.
    if (isatty(fd) == 0) {
        return TerminalColorCapability::None;
    }

    // https://no-color.org
    if (getenv("NO_COLOR") != nullptr) {
        return TerminalColorCapability::None;
    }

    const char* term_var = getenv("TERM");
    if (term_var == nullptr || std::string(term_var) == "dumb") {
        return TerminalColorCapability::None;
    }

    const char* colorterm_var = getenv("COLORTERM");
    if (colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            return TerminalColorCapability::Ansi24bit;
        }
    }

    if (std::string(term_var).find("256color") != std::string::npos) {
        return TerminalColorCapability::Ansi8bit;
    }

    return TerminalColorCapability::Ansi4bit;
#else
    (void) fd;
    return TerminalColorCapability::None;
#endif
}

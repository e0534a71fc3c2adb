#pragma once

#include <cstdint>

namespace minpatch {

enum class TerminalColorCapability : uint16_t {
    None = 0,
    Ansi4bit = 1,   // 16 color palette
    Ansi8bit = 2,   // 256 color palette
    Ansi24bit = 4,  // 24 bit true color
};

// Color support of the terminal behind the given file descriptor. Anything
// that isn't a terminal (pipes, files) gets TerminalColorCapability::None.
TerminalColorCapability
tty_get_color_capability(int fd);

}  // namespace minpatch

#include "log.hpp"

#include "util/tty.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <optional>

using namespace minpatch;

namespace {

LogLevel g_log_level = LogLevel::Normal;

// SGR codes from the 16 color palette; supported by every color capable terminal.
enum class PrefixColor {
    Red = 31,
    Yellow = 33,
    Cyan = 36,
    DarkGray = 90,
};

bool
use_colors() {
    static std::optional<bool> colors;
    if (!colors) {
        colors = tty_get_color_capability(fileno(stderr)) != TerminalColorCapability::None;
    }
    return *colors;
}

void
emit(const char* prefix, PrefixColor color, const std::string& message) {
    if (use_colors()) {
        fmt::print(stderr, "\x1b[1;{}m{}:\x1b[0m {}\n", static_cast<int>(color), prefix, message);
    } else {
        fmt::print(stderr, "{}: {}\n", prefix, message);
    }
}

}  // namespace

void
minpatch::log_set_level(LogLevel level) {
    g_log_level = level;
}

void
minpatch::log_error(const std::string& message) {
    emit("error", PrefixColor::Red, message);
}

void
minpatch::log_warning(const std::string& message) {
    if (g_log_level == LogLevel::Quiet) {
        return;
    }
    emit("warning", PrefixColor::Yellow, message);
}

void
minpatch::log_info(const std::string& message) {
    if (g_log_level == LogLevel::Quiet) {
        return;
    }
    emit("info", PrefixColor::Cyan, message);
}

void
minpatch::log_debug(const std::string& message) {
    if (g_log_level != LogLevel::Verbose) {
        return;
    }
    emit("debug", PrefixColor::DarkGray, message);
}

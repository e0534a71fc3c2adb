#pragma once

/*
    Diagnostics for the command line program.

    Everything goes to stderr, so the patched text can be written to stdout
    without interleaving. Prefixes are colored when stderr is a terminal.
*/

#include <string>

namespace minpatch {

enum class LogLevel {
    Quiet,    // errors only
    Normal,   // errors, warnings and info messages
    Verbose,  // everything, including debug messages
};

void
log_set_level(LogLevel level);

void
log_error(const std::string& message);

void
log_warning(const std::string& message);

void
log_info(const std::string& message);

void
log_debug(const std::string& message);

}  // namespace minpatch

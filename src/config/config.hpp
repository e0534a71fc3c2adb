#pragma once

#include <string>

namespace minpatch {

struct ProgramOptions {
    bool help = false;
    bool check = false;
    bool in_place = false;
    bool quiet = false;
    bool verbose = false;

    // Appended to the original file name to keep a copy of it when patching
    // in place. Empty means no copy.
    std::string backup_suffix;

    std::string original_file;
    std::string patch_file;

    // Empty or "-" means stdout.
    std::string output_file;
};

std::string
config_get_directory();

// Load the defaults from the configuration file into `program_options`.
// A missing file is created with the current defaults.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace minpatch

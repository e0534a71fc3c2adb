#include "config/config.hpp"
#include "patch/patcher.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

namespace {

// Exit codes
const int kExitOk = 0;
const int kExitPatchFailed = 1;
const int kExitTrouble = 2;

// Print the error and every error nested inside it, innermost last.
void
report_error(const std::exception& e, int depth = 0) {
    if (depth == 0) {
        minpatch::log_error(e.what());
    } else {
        minpatch::log_error(fmt::format("{:{}}caused by: {}", "", depth * 4, e.what()));
    }

    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        report_error(nested, depth + 1);
    }
}

}  // namespace

int
main(int argc, char* argv[]) {
    minpatch::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] original_file patch_file

Apply a unified diff to the exact text it was made from

Options:
    -o, --output [file]        write the patched text to file instead of stdout
    -i, --in-place             overwrite original_file with the patched text
    -c, --check                only check that the patch applies
    -q, --quiet                only print errors
    -V, --verbose              print debug messages
    -h, --help                 show this help and exit
    -v, --version              show program version and exit
)",
                                       argv[0]);

        help += "\n";
        help += "Config directory:\n    " + minpatch::config_get_directory() + "\n";

        if (!optional_error_message.empty()) {
            help += "\n" + optional_error_message + "\n";
        }
        fmt::print(optional_error_message.empty() ? stdout : stderr, "{}", help);
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"output", required_argument, 0, 'o'},
                                               {"in-place", no_argument, 0, 'i'},
                                               {"check", no_argument, 0, 'c'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {"verbose", no_argument, 0, 'V'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvo:icqV", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", MINPATCH_VERSION);
                    fmt::print("vcs hash: {}\n", MINPATCH_BUILD_HASH);
                    exit(kExitOk);
                case 'h':
                    opts.help = true;
                    return true;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'i':
                    opts.in_place = true;
                    break;
                case 'c':
                    opts.check = true;
                    break;
                case 'q':
                    opts.quiet = true;
                    opts.verbose = false;
                    break;
                case 'V':
                    opts.verbose = true;
                    opts.quiet = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("error: expected an original file and a patch file");
            return false;
        }

        opts.original_file = in_argv[optind];
        opts.patch_file = in_argv[optind + 1];

        int destinations = (opts.in_place ? 1 : 0) + (opts.check ? 1 : 0) + (opts.output_file.empty() ? 0 : 1);
        if (destinations > 1) {
            show_help("error: -o, -i and -c are mutually exclusive");
            return false;
        }

        return true;
    };

    // Load the global defaults before we override them with command line args
    minpatch::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return kExitTrouble;
    }

    if (opts.help) {
        show_help("");
        return kExitOk;
    }

    if (opts.quiet) {
        minpatch::log_set_level(minpatch::LogLevel::Quiet);
    } else if (opts.verbose) {
        minpatch::log_set_level(minpatch::LogLevel::Verbose);
    }

    std::string original;
    std::string patch;
    if (!minpatch::readfile(opts.original_file, original) || !minpatch::readfile(opts.patch_file, patch)) {
        return kExitTrouble;
    }

    std::string patched;
    try {
        const auto diff = minpatch::parse_unified_diff(patch);
        minpatch::log_debug(fmt::format("{}: {} hunks, {:+} bytes", opts.patch_file, diff.hunks.size(),
                                        diff.total_character_count_delta));
        for (const auto& hunk : diff.hunks) {
            minpatch::log_debug(fmt::format("  @@ -{},{} +{},{} @@", hunk.from_start, hunk.from_count,
                                            hunk.to_start, hunk.to_count));
            for (const auto& [line_number, operations] : hunk.line_operations) {
                for (const auto& operation : operations) {
                    minpatch::log_debug(fmt::format("  {:>6} {}", line_number, minpatch::repr(operation)));
                }
            }
        }

        patched.resize(minpatch::required_size(diff, original));
        patched.resize(minpatch::apply(diff, original, gsl::span<char>(patched.data(), patched.size())));
    } catch (const minpatch::PatchError& e) {
        report_error(e);
        minpatch::log_error(fmt::format("{}: {} does not apply to {}", minpatch::to_string(e.kind()),
                                        opts.patch_file, opts.original_file));
        return kExitPatchFailed;
    }

    if (opts.check) {
        minpatch::log_debug(fmt::format("{} applies cleanly to {}", opts.patch_file, opts.original_file));
        return kExitOk;
    }

    if (opts.in_place) {
        if (!opts.backup_suffix.empty()) {
            const auto backup_file = opts.original_file + opts.backup_suffix;
            minpatch::log_debug(fmt::format("saving original to {}", backup_file));
            if (!minpatch::writefile(backup_file, original)) {
                return kExitTrouble;
            }
        }
        opts.output_file = opts.original_file;
    }

    if (opts.output_file.empty() || opts.output_file == "-") {
        if (fwrite(patched.data(), 1, patched.size(), stdout) != patched.size() || fflush(stdout) != 0) {
            minpatch::log_error("failed to write to stdout");
            return kExitTrouble;
        }
        return kExitOk;
    }

    if (!minpatch::writefile(opts.output_file, patched)) {
        return kExitTrouble;
    }
    minpatch::log_debug(fmt::format("wrote {} bytes to {}", patched.size(), opts.output_file));
    return kExitOk;
}

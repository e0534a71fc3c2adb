#include "unified_diff.hpp"

#include "patch/patch_error.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

#include <exception>
#include <limits>
#include <utility>

using namespace minpatch;

namespace {

bool
is_hunk_header(std::string_view line) {
    return line.size() >= 2 && line[0] == '@' && line[1] == '@';
}

int64_t
character_count_delta(const Hunk& hunk) {
    int64_t delta = 0;
    for (const auto& [line_number, operations] : hunk.line_operations) {
        for (const auto& operation : operations) {
            const auto size = static_cast<int64_t>(operation.text.size()) + 1;
            if (operation.is_output_line() && !operation.is_original_line()) {
                delta += size;
            } else if (operation.is_original_line() && !operation.is_output_line()) {
                delta -= size;
            }
        }
    }
    return delta;
}

void
merge_hunk(UnifiedDiff& diff, Hunk hunk, int64_t& previous_end) {
    if (hunk.anchor_begin() < previous_end) {
        throw PatchError(PatchErrorKind::Parsing,
                         fmt::format("Hunk '@@ -{},{} +{},{} @@' overlaps or precedes the previous hunk",
                                     hunk.from_start, hunk.from_count, hunk.to_start, hunk.to_count));
    }
    previous_end = hunk.anchor_end();

    // Only a hunk without original lines can share its first anchor with
    // the previous hunk; its insertions come first.
    for (const auto& [line_number, operations] : hunk.line_operations) {
        auto& merged = diff.line_operations[line_number];
        merged.insert(merged.end(), operations.begin(), operations.end());
    }

    diff.total_character_count_delta += character_count_delta(hunk);
    diff.hunks.push_back(std::move(hunk));
}

UnifiedDiff
parse(std::string_view patch) {
    // A final separator ends the last line; it doesn't start another one.
    if (!patch.empty() && patch.back() == '\n') {
        patch.remove_suffix(1);
    }

    UnifiedDiff diff;
    int64_t previous_end = std::numeric_limits<int64_t>::min();

    std::string_view header;
    std::vector<std::string_view> body_lines;
    bool in_hunk = false;

    LineCursor cursor{patch};
    std::string_view line;
    while (cursor.next(&line)) {
        if (is_hunk_header(line)) {
            if (in_hunk) {
                merge_hunk(diff, parse_hunk(header, body_lines), previous_end);
            }
            header = line;
            body_lines.clear();
            in_hunk = true;
        } else if (in_hunk) {
            body_lines.push_back(line);
        }
    }

    if (in_hunk) {
        merge_hunk(diff, parse_hunk(header, body_lines), previous_end);
    }

    return diff;
}

}  // namespace

UnifiedDiff
minpatch::parse_unified_diff(std::string_view patch) {
    try {
        return parse(patch);
    } catch (const std::exception&) {
        std::throw_with_nested(PatchError(PatchErrorKind::Parsing, "Error occurred while parsing patch text"));
    }
}

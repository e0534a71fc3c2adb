#pragma once

/*
    Parse the hunks of a unified diff and merge them into a single map from
    original line number to the operations anchored there.

    Only hunks are interpreted. Anything in front of the first "@@" line
    (file headers, "diff" command lines, commit messages) is skipped.
*/

#include "patch/hunk.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace minpatch {

struct UnifiedDiff {
    std::vector<Hunk> hunks;
    LineOperationMap line_operations;

    // Length of the patched text minus length of the original text. Every
    // inserted or deleted line counts with its '\n' separator.
    int64_t total_character_count_delta = 0;
};

// Throws PatchError(PatchErrorKind::Parsing) with the failing hunk's error
// nested inside.
UnifiedDiff
parse_unified_diff(std::string_view patch);

}  // namespace minpatch

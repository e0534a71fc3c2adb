#pragma once

/*
    Parse one hunk of a unified diff: the "@@ -a,b +c,d @@" header and the
    body lines that follow it.

    Every body line is anchored at a line number of the original text.
    Context and deletion lines take consecutive line numbers starting at the
    header's original start line. Insertions are anchored at the line they
    follow (or at the start line when they lead the hunk), after the
    operations already anchored there.
*/

#include "patch/line_operation.hpp"

#include <gsl/span>

#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

namespace minpatch {

using std::int64_t;

// Original line number -> operations anchored at that line, in patch order.
using LineOperationMap = std::map<int64_t, std::vector<LineOperation>>;

struct Hunk {
    int64_t from_start = 0;
    int64_t from_count = 0;
    int64_t to_start = 0;
    int64_t to_count = 0;

    LineOperationMap line_operations;

    // The original lines this hunk occupies, [anchor_begin, anchor_end).
    // A hunk without original lines ("-K,0") inserts after line K and
    // occupies the empty range at K + 1.
    int64_t
    anchor_begin() const {
        return from_count == 0 ? from_start + 1 : from_start;
    }

    int64_t
    anchor_end() const {
        return anchor_begin() + from_count;
    }

    bool
    lengths_are_consistent() const;
};

// Read the ranges of a hunk header into `hunk`. Throws PatchError.
void
parse_hunk_header(std::string_view header, Hunk& hunk);

// Parse a complete hunk. `body_lines` are the lines between this header and
// the next one, without their '\n' separators. Throws PatchError.
Hunk
parse_hunk(std::string_view header, gsl::span<const std::string_view> body_lines);

}  // namespace minpatch

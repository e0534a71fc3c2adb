#pragma once

/*
    One line of a hunk body, classified by its marker character.

    The text is a view into the patch text; the patch must outlive every
    LineOperation made from it.
*/

#include <optional>
#include <string>
#include <string_view>

namespace minpatch {

enum class LineOperationKind {
    Context,  // ' '
    Delete,   // '-'
    Insert,   // '+'
};

struct LineOperation {
    LineOperationKind kind;
    std::string_view text;

    // Present in the original text, so it has to match it.
    bool
    is_original_line() const {
        return kind != LineOperationKind::Insert;
    }

    // Present in the patched text.
    bool
    is_output_line() const {
        return kind != LineOperationKind::Delete;
    }
};

std::optional<LineOperationKind>
line_operation_kind_from_marker(char marker);

char
marker_of(LineOperationKind kind);

std::string
repr(const LineOperation& operation);

}  // namespace minpatch
